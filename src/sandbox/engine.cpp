#include "sandbox/engine.hpp"

namespace autograder::sandbox {

container_engine::~container_engine() {}

}  // namespace autograder::sandbox
