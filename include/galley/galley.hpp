#pragma once

#include "cli.hpp"
#include "config.hpp"
#include "encoder.hpp"
#include "envelope.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "mcp.hpp"
#include "process.hpp"
#include "session.hpp"
#include "utils.hpp"
#include "value.hpp"
