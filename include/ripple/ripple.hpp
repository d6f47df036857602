#pragma once

#include "cache.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "error.hpp"
#include "format.hpp"
#include "graph.hpp"
#include "log.hpp"
#include "mcp.hpp"
#include "orchestrator.hpp"
#include "session.hpp"
#include "utils.hpp"
#include "watch.hpp"
#include "workspace.hpp"
