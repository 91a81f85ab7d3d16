#pragma once

#include "mirrorwatch/v1/types.pb.h"
#include "mirrorwatch/v1/status.pb.h"
#include "mirrorwatch/v1/upstream.pb.h"
