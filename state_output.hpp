// state_output.hpp
#ifndef STATE_OUTPUT_HPP
#define STATE_OUTPUT_HPP

#include "state_computer.hpp"

#include <nlohmann/json.hpp>

#include <string>

// {"cases": {<case id>: {...}}}; missing times are written as null.
nlohmann::json case_states_to_json(const CaseStates& states);

void write_case_states(const CaseStates& states, const std::string& path);

#endif
