#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace floodgate {

// Produces the body of the index page.
class IndexRenderer {
 public:
  virtual ~IndexRenderer() = default;

  [[nodiscard]] virtual std::string_view contentType() const noexcept = 0;

  [[nodiscard]] virtual std::string render(std::string_view userAgent) const = 0;
};

// HTML index page built from a template with the following placeholders:
//   {{sizes}}       one link per representative size, with its resolved byte count
//   {{max_size}}    largest accepted byte count
//   {{user_agent}}  User-Agent of the request (HTML escaped)
// Everything but the user agent is expanded once, at construction.
class HtmlIndexRenderer : public IndexRenderer {
 public:
  static constexpr std::string_view kSizesPlaceholder = "{{sizes}}";
  static constexpr std::string_view kMaxSizePlaceholder = "{{max_size}}";
  static constexpr std::string_view kUserAgentPlaceholder = "{{user_agent}}";

  static const std::string_view kDefaultTemplate;

  // sizeTokens are bare size tokens ("1MB", "2GiB"), linked as "/<token>.bin".
  // Throws std::invalid_argument if a token is not a valid size or exceeds maxSize.
  HtmlIndexRenderer(std::span<const std::string> sizeTokens, uint64_t maxSize,
                    std::string_view htmlTemplate = kDefaultTemplate);

  // Same as above, with the template read from templatePath. Throws std::runtime_error if it cannot be read.
  static HtmlIndexRenderer FromFile(const std::string& templatePath, std::span<const std::string> sizeTokens,
                                    uint64_t maxSize);

  [[nodiscard]] std::string_view contentType() const noexcept override;

  [[nodiscard]] std::string render(std::string_view userAgent) const override;

 private:
  std::string _page;
};

// Appends str to out, escaping the HTML special characters.
void AppendHtmlEscaped(std::string& out, std::string_view str);

}  // namespace floodgate
