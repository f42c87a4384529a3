#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <dispatch/task_dispatcher.hpp>
#include "command.hpp"

enum class OutputFormat {
    Txt,
    Yaml,
};

Result<OutputFormat> parse_output_format(const std::string& name);

// Write every outcome of a batch. Successful results are shown through
// `command.parse` when it yields records, raw otherwise.
void write_outcomes(std::ostream& out, OutputFormat format,
                    const std::vector<RemoteOutcome>& outcomes, const Command& command);
