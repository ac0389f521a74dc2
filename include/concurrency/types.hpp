#pragma once

#include <string>
#include <variant>

// true/false for a task that ran to completion, a message when it threw
typedef std::variant<bool, std::string> ExpectedFuture;
