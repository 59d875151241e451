#pragma once

#include "pageforge/convert/v1/convert_service.pb.h"
#include "pageforge/convert/v1/convert_service.grpc.pb.h"
