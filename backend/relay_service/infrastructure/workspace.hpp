#pragma once
#include <expected>
#include <filesystem>
#include <string>

namespace relay_service {

// Per-request scratch directory. The directory and everything in it is
// removed when the Workspace is destroyed; a failed removal is only logged.
class Workspace {
public:
  static constexpr const char* kInputSlot = "input.mp4";
  static constexpr const char* kDefaultOutputSlot = "output.mp4";

  static std::expected<Workspace, std::string> create(
    const std::filesystem::path& base_dir,
    const std::string& output_slot = kDefaultOutputSlot
  );

  Workspace(Workspace&& other) noexcept;
  Workspace& operator=(Workspace&& other) noexcept;
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  ~Workspace();

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path inputPath() const { return path_ / kInputSlot; }
  std::filesystem::path outputPath() const { return path_ / output_slot_; }

private:
  Workspace(std::filesystem::path path, std::string output_slot);
  void release();

  std::filesystem::path path_;
  std::string output_slot_;
};

} // namespace relay_service
