#pragma once

#include <cjb/error.h>
#include <cjb/hooks.h>
#include <cjb/kind.h>
#include <cjb/parse.h>
#include <cjb/value.h>
#include <cjb/version.h>
