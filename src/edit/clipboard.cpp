#include <keyforge/clipboard.hpp>

namespace keyforge
{

void MemoryClipboard::write_text(std::string_view text)
{
    text_ = std::string(text);
}

std::optional<std::string> MemoryClipboard::read_text() const
{
    return text_;
}

}  // namespace keyforge
