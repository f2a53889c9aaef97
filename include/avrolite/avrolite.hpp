#pragma once

#include "avrolite/container.hpp"
#include "avrolite/cursor.hpp"
#include "avrolite/error.hpp"
#include "avrolite/record.hpp"
#include "avrolite/schemas.hpp"
#include "avrolite/types.hpp"
#include "avrolite/value.hpp"
