#pragma once

#include <ostream>
#include <string>
#include "hazard/evaluation_result.h"

namespace smallspot {

// Writes the fixed-layout console report for one evaluation.
void print_report(std::ostream& os, const EvaluationResult& result);

std::string format_report(const EvaluationResult& result);

} // namespace smallspot
