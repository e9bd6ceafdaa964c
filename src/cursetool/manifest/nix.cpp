#include <cursetool/manifest/nix.h>

#include <fmt/format.h>

namespace cursetool {

string
nix_string_literal(string const& text)
{
    string quoted = "\"";
    for (size_t i = 0; i != text.size(); ++i)
    {
        char c = text[i];
        switch (c)
        {
            case '"':
                quoted += "\\\"";
                break;
            case '\\':
                quoted += "\\\\";
                break;
            case '\n':
                quoted += "\\n";
                break;
            case '\r':
                quoted += "\\r";
                break;
            case '\t':
                quoted += "\\t";
                break;
            case '$':
                // "${" would start an interpolation.
                if (i + 1 < text.size() && text[i + 1] == '{')
                    quoted += "\\$";
                else
                    quoted += '$';
                break;
            default:
                quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

static char const*
nix_bool(bool value)
{
    return value ? "true" : "false";
}

static void
write_nix_entry(string& out, nix_mod_entry const& entry)
{
    out += fmt::format("  {} = {{\n", nix_string_literal(entry.name));
    auto attribute = [&](char const* name, string const& value) {
        out += fmt::format("    {} = {};\n", name, value);
    };
    attribute("title", nix_string_literal(entry.title));
    attribute("name", nix_string_literal(entry.name));
    if (entry.id)
        attribute("id", fmt::format("{}", *entry.id));
    if (entry.file)
        attribute("fileId", fmt::format("{}", *entry.file));
    attribute("side", nix_string_literal(side_name(entry.side)));
    attribute("required", nix_bool(entry.required));
    attribute("default", nix_bool(entry.default_));
    attribute("filename", nix_string_literal(entry.filename));
    if (entry.page)
        attribute("page", nix_string_literal(*entry.page));
    attribute("src", nix_string_literal(entry.src));
    attribute("md5", nix_string_literal(entry.md5));
    attribute("sha256", nix_string_literal(entry.sha256));
    attribute("size", fmt::format("{}", entry.size));
    out += "  };\n";
}

string
write_nix_manifest(std::vector<nix_mod_entry> const& entries)
{
    string out = "{\n";
    for (auto const& entry : entries)
        write_nix_entry(out, entry);
    out += "}\n";
    return out;
}

} // namespace cursetool
