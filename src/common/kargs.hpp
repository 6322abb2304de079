#pragma once

#include <string>
#include <vector>

namespace nodeos {

// Split on spaces unless the space sits inside a double-quoted span.
// 'boo=bar="YIPPIE KA YAY" baz foo' -> ['boo=bar="YIPPIE KA YAY"', 'baz', 'foo'].
// Quotes stay in the tokens and empty tokens are dropped. Newlines and tabs
// outside quotes also separate tokens so raw tool output can be fed in.
std::vector<std::string> quoteSpaceSplit(const std::string &text);

// Plain single-space split used for /proc/cmdline.
std::vector<std::string> spaceSplit(const std::string &text);

bool isKernelArgPresent(const std::vector<std::string> &active, const std::string &arg);

} // namespace nodeos
