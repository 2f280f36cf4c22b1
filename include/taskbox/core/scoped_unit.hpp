/**
 * @file scoped_unit.hpp
 * @brief RAII ownership of an execution unit
 *
 * @date 2025
 */

#pragma once

#include "taskbox/core/execution_unit.hpp"

#include <memory>
#include <string>
#include <vector>

namespace taskbox {
namespace core {

/**
 * @class ScopedUnit
 * @brief Owns an ExecutionUnit and cleans it up on every exit path
 *
 * **Usage Example**:
 * @code
 * ScopedUnit unit(gateway, config);
 * unit->Start();
 * auto result = unit->Exec({"pytest", "-x"});
 * // container released here, even if Exec() threw
 * @endcode
 */
class ScopedUnit {
public:
    ScopedUnit(std::shared_ptr<runtime::RuntimeGateway> gateway,
               ContainerConfig config,
               UnitOptions options = {});

    explicit ScopedUnit(std::unique_ptr<ExecutionUnit> unit);

    ~ScopedUnit();

    ScopedUnit(ScopedUnit&& other) noexcept = default;
    ScopedUnit& operator=(ScopedUnit&& other) noexcept;

    ScopedUnit(const ScopedUnit&) = delete;
    ScopedUnit& operator=(const ScopedUnit&) = delete;

    ExecutionUnit& operator*() const { return *unit_; }
    ExecutionUnit* operator->() const { return unit_.get(); }
    ExecutionUnit* Get() const { return unit_.get(); }

private:
    std::unique_ptr<ExecutionUnit> unit_;
};

/**
 * @brief Run one command in a fresh unit and release it
 *
 * With an empty @p argv the config's own command is waited for; otherwise
 * the container idles on the keep-alive command and @p argv is exec'd.
 *
 * @return Result of the command
 * @throws ImageError, ConnectionError, CreateError, StartError, ExecError,
 *         OutOfMemoryError, TimeoutError, CancelledError
 */
ExecResult RunCommand(std::shared_ptr<runtime::RuntimeGateway> gateway,
                      ContainerConfig config,
                      const std::vector<std::string>& argv,
                      UnitOptions options = {});

} // namespace core
} // namespace taskbox
