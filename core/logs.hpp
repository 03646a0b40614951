#pragma once

class Options;

namespace logs
{
// console sink for messages emitted before the route file is read
void preinit();
// throws std::runtime_error if requested level is above PATHMUX_LOG_LEVEL
void init(const Options& opt);
}
