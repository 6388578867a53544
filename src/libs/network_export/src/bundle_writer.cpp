#include <network_export/bundle_writer.hpp>
#include <network_log/logger.hpp>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

namespace network_export {

namespace {

std::string random_suffix() {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::random_device rd;
    std::uniform_int_distribution<int> pick(0, sizeof(alphabet) - 2);
    std::string s;
    for (int i = 0; i < 8; ++i) s += alphabet[pick(rd)];
    return s;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot open " + path.string() + " for writing");
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
    f.close();
    if (!f) throw std::runtime_error("failed writing " + path.string());
}

// Absolute, normalized, with a non-empty final component. Refuses a
// filesystem root and any directory containing the working directory.
std::filesystem::path resolve_target(const std::filesystem::path& target_dir) {
    namespace fs = std::filesystem;
    if (target_dir.empty()) throw std::runtime_error("bundle target directory is empty");

    fs::path target = fs::absolute(target_dir).lexically_normal();
    if (!target.has_filename() && target != target.root_path()) target = target.parent_path();
    if (target == target.root_path() || !target.has_filename())
        throw std::runtime_error("refusing to replace " + target.string() + " with a bundle");

    const fs::path cwd = fs::current_path().lexically_normal();
    const fs::path inside = cwd.lexically_relative(target);
    if (!inside.empty() && *inside.begin() != "..")
        throw std::runtime_error("refusing to replace " + target.string()
            + ", it contains the working directory");
    return target;
}

} // namespace

void write_bundle(const ScenarioBundle& bundle, const std::filesystem::path& target_dir) {
    namespace fs = std::filesystem;
    const fs::path target = resolve_target(target_dir);
    const fs::path parent = target.parent_path();
    fs::create_directories(parent);
    const std::string suffix = random_suffix();
    const fs::path staging = parent / ("." + target.filename().string() + ".staging-" + suffix);
    const fs::path previous = parent / ("." + target.filename().string() + ".previous-" + suffix);

    try {
        fs::create_directory(staging);
        for (const auto& [name, content] : bundle.files)
            write_file(staging / name, content);
    } catch (...) {
        std::error_code ec;
        fs::remove_all(staging, ec);
        throw;
    }

    // The old target is only moved aside until the new one is in place.
    const bool replacing = fs::exists(target);
    try {
        if (replacing) fs::rename(target, previous);
        fs::rename(staging, target);
    } catch (const fs::filesystem_error&) {
        std::error_code ec;
        if (replacing && fs::exists(previous, ec) && !fs::exists(target, ec)) fs::rename(previous, target, ec);
        fs::remove_all(staging, ec);
        throw;
    }

    auto logger = network_log::engine_logger();
    if (replacing) {
        std::error_code ec;
        fs::remove_all(previous, ec);
        if (ec) logger->warn("Could not remove previous bundle {}: {}", previous.string(), ec.message());
    }
    logger->info("Wrote {} files to {}", bundle.files.size(), target.string());
}

std::filesystem::path make_work_directory(const std::string& prefix) {
    namespace fs = std::filesystem;
    const fs::path base = fs::temp_directory_path();
    for (int attempt = 0; attempt < 16; ++attempt) {
        const fs::path dir = base / (prefix + random_suffix());
        if (fs::create_directory(dir)) return dir;
    }
    throw std::runtime_error("could not create a work directory under " + base.string());
}

std::vector<std::string> network_compile_command() {
    return {
        "netconvert",
        "--node-files", file_names::nodes,
        "--edge-files", file_names::edges,
        "--output-file", file_names::compiled_network,
        "--no-turnarounds",
    };
}

std::vector<std::string> simulation_command(bool gui) {
    return { gui ? "sumo-gui" : "sumo", "-c", file_names::run_config, "--no-step-log", "true" };
}

} // namespace network_export
