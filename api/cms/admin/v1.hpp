#pragma once

#include "cms/admin/v1/admin_frontend.pb.h"
#include "cms/admin/v1/service_rpc.pb.h"

#include "cms/admin/v1/admin_frontend.grpc.pb.h"
#include "cms/admin/v1/service_rpc.grpc.pb.h"
