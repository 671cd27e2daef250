#pragma once

#include "weave/v1/common.pb.h"
#include "weave/v1/history.pb.h"
#include "weave/v1/task.pb.h"

#include "weave/v1/admin_service.pb.h"
#include "weave/v1/workflow_service.pb.h"
