#pragma once

#include "keyserver/publish/v1/publish.pb.h"

namespace keyserver::v1 {
using namespace ::keyserver::publish::v1;
}
