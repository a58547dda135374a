#pragma once

#include <quarry/cache/cache.hpp>
#include <quarry/catalog/catalog.hpp>
#include <quarry/core/error.hpp>
#include <quarry/core/value.hpp>
#include <quarry/engine.hpp>
#include <quarry/plan/plan.hpp>
#include <quarry/runtime/coordinator.hpp>
