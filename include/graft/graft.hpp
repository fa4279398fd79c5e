// Umbrella header for the patch engine and its EDN front end.
#pragma once
#include "graft/bridge.hpp"
#include "graft/diagnostics.hpp"
#include "graft/driver.hpp"
#include "graft/edn.hpp"
#include "graft/errors.hpp"
#include "graft/forest.hpp"
#include "graft/path.hpp"
#include "graft/patch.hpp"
#include "graft/script.hpp"
