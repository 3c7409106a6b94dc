#include "floodgate/index-renderer.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "floodgate/file.hpp"
#include "floodgate/http-constants.hpp"
#include "floodgate/log.hpp"
#include "floodgate/size-spec.hpp"

namespace floodgate {

namespace {

// 10000000 -> "10 000 000"
std::string GroupDigits(uint64_t value) {
  const std::string digits = std::to_string(value);
  std::string ret;
  ret.reserve(digits.size() + (digits.size() / 3U));
  for (std::string::size_type pos = 0; pos < digits.size(); ++pos) {
    if (pos != 0 && (digits.size() - pos) % 3U == 0) {
      ret.push_back(' ');
    }
    ret.push_back(digits[pos]);
  }
  return ret;
}

void ReplaceAll(std::string& str, std::string_view from, std::string_view to) {
  for (auto pos = str.find(from); pos != std::string::npos; pos = str.find(from, pos + to.size())) {
    str.replace(pos, from.size(), to);
  }
}

std::string RenderSizes(std::span<const std::string> sizeTokens, uint64_t maxSize) {
  std::string out;
  for (const auto& token : sizeTokens) {
    const std::string filename = token + ".bin";
    const auto parsed = ParseSizeToken(filename, maxSize);
    const auto* spec = std::get_if<SizeSpec>(&parsed);
    if (spec == nullptr) {
      log::critical("Index size '{}' is not a valid size lower than the maximum of {} bytes", token, maxSize);
      throw std::invalid_argument("invalid index size");
    }
    out.append("<li><a href=\"/");
    AppendHtmlEscaped(out, filename);
    out.append("\">");
    AppendHtmlEscaped(out, token);
    out.append("</a> (").append(GroupDigits(spec->byteCount)).append(" bytes)</li>\n");
  }
  return out;
}

}  // namespace

const std::string_view HtmlIndexRenderer::kDefaultTemplate = R"html(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>floodgate speed test</title>
</head>
<body>
<h1>Speed test files</h1>
<p>Download one of the files below to measure your bandwidth. Any other size works too:
<code>/&lt;size&gt;&lt;unit&gt;.&lt;ext&gt;</code> with unit B, KB, MB, GB, TB (powers of 1000) or KiB, MiB, GiB, TiB
(powers of 1024), up to {{max_size}} bytes.</p>
<ul>
{{sizes}}</ul>
<p><small>{{user_agent}}</small></p>
</body>
</html>
)html";

HtmlIndexRenderer::HtmlIndexRenderer(std::span<const std::string> sizeTokens, uint64_t maxSize,
                                     std::string_view htmlTemplate)
    : _page(htmlTemplate) {
  ReplaceAll(_page, kSizesPlaceholder, RenderSizes(sizeTokens, maxSize));
  ReplaceAll(_page, kMaxSizePlaceholder, GroupDigits(maxSize));
}

HtmlIndexRenderer HtmlIndexRenderer::FromFile(const std::string& templatePath, std::span<const std::string> sizeTokens,
                                              uint64_t maxSize) {
  File file(templatePath);
  if (!file) {
    throw std::runtime_error("Unable to open index template " + templatePath);
  }
  return {sizeTokens, maxSize, file.loadAllContent()};
}

std::string_view HtmlIndexRenderer::contentType() const noexcept { return http::ContentTypeTextHtml; }

std::string HtmlIndexRenderer::render(std::string_view userAgent) const {
  if (_page.find(kUserAgentPlaceholder) == std::string::npos) {
    return _page;
  }
  std::string escaped;
  AppendHtmlEscaped(escaped, userAgent);
  std::string ret = _page;
  ReplaceAll(ret, kUserAgentPlaceholder, escaped);
  return ret;
}

void AppendHtmlEscaped(std::string& out, std::string_view str) {
  for (char ch : str) {
    switch (ch) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      case '\'':
        out.append("&#39;");
        break;
      default:
        out.push_back(ch);
    }
  }
}

}  // namespace floodgate
