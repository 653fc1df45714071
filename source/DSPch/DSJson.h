#pragma once

#include "DSSuppressWarning.h"

DS_SUPPRESS_WARNING_PUSH
DS_SUPPRESS_WARNING( "-Wdeprecated-declarations", 4996 )
#include <json/json.h>
DS_SUPPRESS_WARNING_POP
