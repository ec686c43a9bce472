#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace keyforge
{

// Text clipboard the engine copies keys into. Hosts wire this to the system
// clipboard or to persistent local storage.
class ClipboardSink
{
   public:
    virtual ~ClipboardSink() = default;

    virtual void write_text(std::string_view text) = 0;

    // nullopt when the clipboard holds nothing.
    virtual std::optional<std::string> read_text() const = 0;
};

// In-process clipboard; the engine's default when no sink is attached.
class MemoryClipboard : public ClipboardSink
{
   public:
    void write_text(std::string_view text) override;
    std::optional<std::string> read_text() const override;

    void clear() { text_.reset(); }

   private:
    std::optional<std::string> text_;
};

}  // namespace keyforge
