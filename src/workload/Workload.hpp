#pragma once
#include <optional>
#include <string>

namespace burst {

// ---------------------------------------------------------------------------
// One pluggable stress computation.
//
// run()      performs one unit of work; repeatable on the same instance.
// validate() checks the outcome of the last run(). An empty optional means
//            the result is good; a message means the hardware produced a
//            wrong answer.
//
// Anything thrown by either call is an unrelated error (allocation failure,
// library error) and is kept apart from a validation failure by the engine.
//
// Instances are not shared between cores: each engine thread owns its own.
// ---------------------------------------------------------------------------
class Workload {
public:
    virtual ~Workload() = default;

    virtual const char* name() const = 0;
    virtual void run() = 0;
    virtual std::optional<std::string> validate() = 0;
};

}
