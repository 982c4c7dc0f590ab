#pragma once

#include <string>

#include "internal/model/publish.hpp"

namespace keyserver::publish {

/*
  Attestation nonce

  Binds the content of a publish request to a device attestation so that an
  attestation cannot be replayed against different keys.

  The cleartext layout is a contract with the device side and the attestation
  verifier and must not change:

    appPackageName|key[,key...]|region[,region...]|verificationPayload

  - each key is base64key.intervalNumber.intervalCount.transmissionRisk
  - keys are sorted by their base64 string, not by the decoded bytes
  - regions are upper-cased, then sorted. Only ASCII region codes are
    accepted, a non-ASCII region throws util::InvalidArgument
  - empty fields are kept as empty strings, there are always three '|'

  The nonce is base64(sha256(cleartext)), standard alphabet, padded.
  Neither function depends on the order of keys or regions in the request.
*/

std::string CanonicalCleartext(const model::Publish& publish);

std::string AttestationNonce(const model::Publish& publish);

} // namespace keyserver::publish
