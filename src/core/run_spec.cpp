/**
 * @file run_spec.cpp
 * @brief RunSpecBuilder implementation
 *
 * @date 2025
 */

#include "dockhand/core/run_spec.hpp"

namespace dockhand {
namespace core {

// ============================================================================
// RUN SPEC BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

RunSpecBuilder::RunSpecBuilder(const std::string& image, const std::string& name) {
    spec_.image = image;
    spec_.name = name;
}

RunSpecBuilder& RunSpecBuilder::WithCommand(const std::vector<std::string>& command) {
    spec_.command = command;
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithEntrypoint(const std::string& entrypoint) {
    spec_.entrypoint = entrypoint;
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithWorkdir(const std::string& workdir) {
    spec_.workdir = workdir;
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithVolume(const std::string& volume) {
    spec_.volumes.push_back(volume);
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithEnvironment(const std::string& key,
                                                const std::string& value) {
    spec_.environment[key] = value;
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithLabel(const std::string& key, const std::string& value) {
    spec_.labels[key] = value;
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithHostname(const std::string& hostname) {
    spec_.hostname = hostname;
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithNetwork(const std::string& network) {
    spec_.network = network;
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithAutoRemove(bool remove) {
    spec_.remove = remove;
    return *this;
}

RunSpecBuilder& RunSpecBuilder::WithMountFolder(const std::string& folder) {
    spec_.mount_folder = folder;
    return *this;
}

RunSpec RunSpecBuilder::Build() const {
    return spec_;
}

} // namespace core
} // namespace dockhand
