#pragma once

#include "libsvcloc/export.hpp"
#include "libsvcloc/fwd.hpp"
#include "libsvcloc/result.hpp"
#include "libsvcloc/exceptions.hpp"
#include "libsvcloc/type_traits.hpp"
#include "libsvcloc/descriptor.hpp"
#include "libsvcloc/registry.hpp"
#include "libsvcloc/resolver.hpp"
#include "libsvcloc/locator.hpp"
#include "libsvcloc/logging.hpp"
