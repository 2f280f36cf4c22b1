/**
 * @file scoped_unit.cpp
 * @brief RAII unit guard and one-shot command runner
 *
 * @date 2025
 */

#include "taskbox/core/scoped_unit.hpp"
#include "taskbox/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace taskbox {
namespace core {

ScopedUnit::ScopedUnit(std::shared_ptr<runtime::RuntimeGateway> gateway,
                       ContainerConfig config,
                       UnitOptions options)
    : unit_(std::make_unique<ExecutionUnit>(std::move(gateway), std::move(config), options)) {
}

ScopedUnit::ScopedUnit(std::unique_ptr<ExecutionUnit> unit)
    : unit_(std::move(unit)) {
    if (!unit_) {
        throw InvalidStateError("ScopedUnit requires a unit");
    }
}

ScopedUnit::~ScopedUnit() {
    if (unit_) {
        unit_->Cleanup();
    }
}

ScopedUnit& ScopedUnit::operator=(ScopedUnit&& other) noexcept {
    if (this != &other) {
        if (unit_) {
            unit_->Cleanup();
        }
        unit_ = std::move(other.unit_);
    }
    return *this;
}

ExecResult RunCommand(std::shared_ptr<runtime::RuntimeGateway> gateway,
                      ContainerConfig config,
                      const std::vector<std::string>& argv,
                      UnitOptions options) {
    if (!argv.empty()) {
        // The exec'd command is the work; the primary process only keeps the container alive
        config.command.clear();
    }

    ScopedUnit unit(std::move(gateway), std::move(config), options);
    unit->Start();

    ExecResult result = argv.empty() ? unit->Wait() : unit->Exec(argv);

    spdlog::info("Unit {} finished: {} ({} ms)", unit->Name(), ToString(unit->Status()),
                 result.duration.count());
    return result;
}

} // namespace core
} // namespace taskbox
