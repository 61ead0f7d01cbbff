#pragma once

#include "bytecode.hpp"
#include "context.hpp"
#include "debug.hpp"
#include "error.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "types.hpp"
#include "vm.hpp"
