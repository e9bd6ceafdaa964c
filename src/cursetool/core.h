#ifndef CURSETOOL_CORE_H
#define CURSETOOL_CORE_H

#include <cursetool/core/exception.hpp>
#include <cursetool/core/type_definitions.hpp>

#endif
