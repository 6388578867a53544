#pragma once

#include <network_export/serializer.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace network_export {

// Writes every file of the bundle into target_dir. Files go to a staging
// directory next to it first, which replaces target_dir only once every write
// succeeded; an existing target_dir is moved aside and removed only after the
// new one is in place. A filesystem root, or a directory that contains the
// working directory (".", ".."), is refused with std::runtime_error.
// Throws std::runtime_error or filesystem_error on failure.
void write_bundle(const ScenarioBundle& bundle, const std::filesystem::path& target_dir);

// Fresh, exclusive directory under the system temp dir for one run of the
// external tools.
std::filesystem::path make_work_directory(const std::string& prefix = "traffic_scenario_");

// Command lines of the external tools, to be run inside a work directory
// holding the bundle. Only the argument contract lives here.
std::vector<std::string> network_compile_command();
std::vector<std::string> simulation_command(bool gui);

} // namespace network_export
