#include "superprompt/providers/mode_store.hpp"

#include "superprompt/exceptions.hpp"
#include "superprompt/types.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace superprompt::providers
{

ModeStore::ModeStore(std::filesystem::path project_root)
    : path_(std::move(project_root) / ".super-prompt" / "mode.json")
{
}

std::string ModeStore::canonical(const std::string& mode)
{
    std::string m = mode;
    std::transform(m.begin(), m.end(), m.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (m == "default")
        return kDefaultMode;
    if (m == "gpt" || m == "grok" || m == "claude")
        return m;
    return {};
}

std::string ModeStore::get() const
{
    std::ifstream in(path_);
    if (!in)
        return kDefaultMode;

    Json data = Json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (data.is_discarded() || !data.is_object())
        return kDefaultMode;

    auto it = data.find("llm_mode");
    if (it == data.end() || !it->is_string())
        return kDefaultMode;

    std::string mode = canonical(it->get<std::string>());
    return mode.empty() ? kDefaultMode : mode;
}

std::string ModeStore::set(const std::string& mode) const
{
    const std::string m = canonical(mode);
    if (m.empty())
        throw ValidationError("mode must be one of: gpt, grok, claude");

    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec)
        throw Error("cannot create " + path_.parent_path().string() + ": " + ec.message());

    std::ofstream out(path_, std::ios::trunc);
    out << Json{{"llm_mode", m}}.dump(2) << '\n';
    out.flush();
    if (!out)
        throw Error("cannot write " + path_.string());
    return m;
}

} // namespace superprompt::providers
