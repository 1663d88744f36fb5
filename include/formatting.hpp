#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <ostream>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
void printSolutions(std::ostream& out, const Constraints& constraints, const std::vector<Solution>& solutions);
