#include "log_channel.hpp"

namespace base {

const log_channel log_channel::generic("generic");
const log_channel log_channel::dtype("dtype");
const log_channel log_channel::storage("storage");
const log_channel log_channel::bridge("bridge");

} // namespace base
