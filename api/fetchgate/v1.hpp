#pragma once

#include "fetchgate/v1/types.pb.h"
#include "fetchgate/v1/tunnel.pb.h"
#include "fetchgate/v1/download_service.pb.h"

#include "fetchgate/v1/tunnel.grpc.pb.h"
#include "fetchgate/v1/download_service.grpc.pb.h"
