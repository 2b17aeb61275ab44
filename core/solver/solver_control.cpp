#include "solver/solver_control.hpp"
#include "common/errors.hpp"

namespace linksim {

void IterationCheckpoint::reached(int iteration) {
    if (control_.cancel && control_.cancel->isCancelled()) {
        throw RunCancelled(phase_ + " cancelled at iteration " + std::to_string(iteration));
    }
    if (control_.yield && control_.yield_interval > 0 &&
        iteration % control_.yield_interval == 0) {
        control_.yield(iteration);
    }
}

} // namespace linksim
