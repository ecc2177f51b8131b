#pragma once
#include "request.h"
#include "ports.h"

namespace Validate {
    VoidResult request(const CanonicalRequest& req);
}
