#pragma once
#include <filesystem>
#include <string>

namespace superprompt::providers
{

/// Persisted LLM mode of a project: {"llm_mode": "<mode>"} in
/// <project_root>/.super-prompt/mode.json.
class ModeStore
{
  public:
    static constexpr const char* kDefaultMode = "gpt";

    explicit ModeStore(std::filesystem::path project_root);

    /// Current mode. A missing, unreadable or malformed file reads as the default.
    std::string get() const;

    /// Store a mode (case-insensitive; "default" means gpt) and return the stored value.
    /// Throws ValidationError for an unknown mode, Error when the file cannot be written.
    std::string set(const std::string& mode) const;

    const std::filesystem::path& path() const
    {
        return path_;
    }

    /// Lowercased canonical mode, or an empty string when the name is not a mode.
    static std::string canonical(const std::string& mode);

  private:
    std::filesystem::path path_;
};

} // namespace superprompt::providers
