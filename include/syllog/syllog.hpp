#pragma once

// Saturation engine
#include "logic/logic.hpp"

// Statement loading
#include "input/loader.hpp"
#include "input/statement.hpp"

// DOT export
#include "visualization/graphviz.hpp"
#include "visualization/relation_exporter.hpp"

// Command-line front end
#include "app/cli.hpp"
