#pragma once

#include "api/txcluster/v1/report.pb.h"
#include "config/config.pb.h"
