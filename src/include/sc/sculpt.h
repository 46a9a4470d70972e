// Public header for the sculpt library
#pragma once

#include <sc/check.h>
#include <sc/coerce.h>
#include <sc/config.h>
#include <sc/error.h>
#include <sc/issue.h>
#include <sc/json.h>
#include <sc/kind.h>
#include <sc/merge.h>
#include <sc/payload.h>
#include <sc/registry.h>
#include <sc/schema.h>
#include <sc/value.h>
