#pragma once

#include "analyzer.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "container.hpp"
#include "format.hpp"
#include "http.hpp"
#include "log.hpp"
#include "process.hpp"
#include "scratch.hpp"
#include "transpiler.hpp"
