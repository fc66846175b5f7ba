#ifndef COBRA_COBRA_HPP
#define COBRA_COBRA_HPP

#include "command.hpp"
#include "errors.hpp"
#include "flag.hpp"
#include "flag_set.hpp"
#include "help.hpp"
#include "parser.hpp"
#include "root_command.hpp"
#include "runtime.hpp"
#include "value.hpp"

#endif // COBRA_COBRA_HPP
