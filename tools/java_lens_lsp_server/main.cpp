// java_lens LSP server (stdio JSON-RPC)
//
// This is a thin wrapper around java_lens::lsp::Workspace (serverless APIs).
// Besides the standard document requests it answers the javaLens/* requests
// used by the structure, call graph, system service and lifecycle views.
//
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <java_lens/basic/cancellation.hpp>
#include <java_lens/basic/source_manager.hpp>
#include <java_lens/driver/workspace_scan.hpp>
#include <java_lens/lsp/lsp.hpp>
#include <java_lens/project/project_config.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

using nlohmann::json;

namespace
{

struct DocState
{
  std::string uri;
  std::string text;
  std::string language_id = "java";
  std::vector<uint32_t> line_offsets;  // byte offsets of each line start
};

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int lsp_severity(std::string_view s)
{
  // LSP DiagnosticSeverity:
  // 1 Error, 2 Warning, 3 Information, 4 Hint
  if (s == "Error") return 1;
  if (s == "Warning") return 2;
  if (s == "Info") return 3;
  if (s == "Hint") return 4;
  return 3;
}

int symbol_kind(std::string_view s)
{
  // LSP SymbolKind (subset)
  if (s == "Class") return 5;
  if (s == "InnerClass") return 5;
  if (s == "Method") return 6;
  if (s == "Field") return 8;
  return 13;
}

json empty_lsp_range()
{
  return json{
    {"start", json{{"line", 0}, {"character", 0}}}, {"end", json{{"line", 0}, {"character", 0}}}};
}

// Byte length of the UTF-8 sequence led by `c0`.
size_t utf8_sequence_length(unsigned char c0)
{
  if ((c0 & 0xE0) == 0xC0) return 2;
  if ((c0 & 0xF0) == 0xE0) return 3;
  if ((c0 & 0xF8) == 0xF0) return 4;
  return 1;
}

// UTF-16 code units in a UTF-8 slice; 4-byte sequences take two units.
uint32_t utf16_length(std::string_view s)
{
  uint32_t units = 0;
  for (size_t i = 0; i < s.size();) {
    const size_t n = utf8_sequence_length(static_cast<unsigned char>(s[i]));
    units += n == 4 ? 2 : 1;
    i += n;
  }
  return units;
}

/// 1-based line and byte column to an LSP position in `encoding`.
/// Without the document text the byte column is passed through.
json to_lsp_position(const DocState * doc, int line, int column, std::string_view encoding)
{
  const int l0 = std::max(0, line - 1);
  const int c0 = std::max(0, column - 1);
  if (
    encoding != "utf-16" || doc == nullptr ||
    static_cast<size_t>(l0) >= doc->line_offsets.size()) {
    return json{{"line", l0}, {"character", c0}};
  }

  const std::string_view rest = std::string_view(doc->text).substr(doc->line_offsets[l0]);
  const std::string_view prefix = rest.substr(0, std::min<size_t>(c0, rest.size()));
  return json{{"line", l0}, {"character", utf16_length(prefix)}};
}

json to_lsp_range_from_full_range(
  const json & fr, const DocState * doc, std::string_view encoding)
{
  return json{
    {"start", to_lsp_position(doc, fr.value("startLine", 1), fr.value("startColumn", 1), encoding)},
    {"end", to_lsp_position(doc, fr.value("endLine", 1), fr.value("endColumn", 1), encoding)},
  };
}

/// Text of a definition target, read from disk unless it is an open document.
std::optional<DocState> load_target_doc(
  const std::unordered_map<std::string, DocState> & docs, const std::string & uri)
{
  if (auto it = docs.find(uri); it != docs.end()) {
    return it->second;
  }
  const auto path = java_lens::file_uri_to_path(uri);
  if (!path) {
    return std::nullopt;
  }
  auto text = java_lens::read_file_to_string(*path);
  if (!text) {
    return std::nullopt;
  }
  DocState d;
  d.uri = uri;
  d.text = std::move(*text);
  d.line_offsets = java_lens::build_line_index(d.text);
  return d;
}

/// LSP position to byte offset, `character` counted in `encoding` units.
/// A position inside a code point clamps to its start, one past the line to its end.
std::optional<uint32_t> lsp_position_to_byte_offset(
  const DocState & doc, uint32_t line, uint32_t character, std::string_view encoding)
{
  if (doc.line_offsets.empty()) {
    return std::nullopt;
  }
  if (line >= doc.line_offsets.size()) {
    return static_cast<uint32_t>(doc.text.size());
  }

  const uint32_t line_start = doc.line_offsets[line];
  const uint32_t next_line_start = (line + 1 < doc.line_offsets.size())
                                     ? doc.line_offsets[line + 1]
                                     : static_cast<uint32_t>(doc.text.size());
  const std::string_view slice =
    std::string_view(doc.text).substr(line_start, next_line_start - line_start);

  if (encoding != "utf-16") {
    return line_start + std::min<uint32_t>(character, static_cast<uint32_t>(slice.size()));
  }

  uint32_t units = 0;
  size_t byte_index = 0;
  while (byte_index < slice.size()) {
    const size_t n = utf8_sequence_length(static_cast<unsigned char>(slice[byte_index]));
    const uint32_t width = n == 4 ? 2 : 1;
    if (units + width > character) {
      break;
    }
    units += width;
    byte_index += n;
  }
  return line_start + static_cast<uint32_t>(std::min(byte_index, slice.size()));
}

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    // Ignore malformed message.
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  try {
    return json::parse(body);
  } catch (const json::parse_error &) {
    return std::nullopt;
  }
}

/// Parse a Workspace payload; a malformed one degrades to `fallback`.
json parse_payload(const std::string & text, json fallback)
{
  try {
    return json::parse(text);
  } catch (const json::parse_error &) {
    return fallback;
  }
}

}  // namespace

int main()
{
  try {
    java_lens::lsp::Workspace ws;
    java_lens::CancellationFlag cancel;

    std::unordered_map<std::string, DocState> docs;
    std::string root_dir;
    std::string negotiated_position_encoding = "utf-8";

    auto upsert_doc = [&](const std::string & uri, const std::string & text,
                          const std::string & language_id) -> DocState & {
      auto & d = docs[uri];
      d.uri = uri;
      d.text = text;
      d.language_id = language_id;
      d.line_offsets = java_lens::build_line_index(d.text);
      ws.set_document(uri, text, language_id);
      return d;
    };

    auto publish_diagnostics = [&](const DocState & doc) {
      const json dj =
        parse_payload(ws.diagnostics_json(doc.uri), json{{"uri", doc.uri}, {"items", json::array()}});

      json lsp_diags = json::array();
      if (dj.contains("items") && dj["items"].is_array()) {
        for (const auto & it : dj["items"]) {
          if (!it.is_object()) continue;
          json d0;
          d0["message"] = it.value("message", "");
          d0["severity"] = lsp_severity(it.value("severity", "Info"));
          if (it.contains("source") && it["source"].is_string()) {
            d0["source"] = it["source"];
          }
          if (it.contains("code") && it["code"].is_string()) {
            d0["code"] = it["code"];
          }
          if (it.contains("range") && it["range"].is_object()) {
            d0["range"] =
              to_lsp_range_from_full_range(it["range"], &doc, negotiated_position_encoding);
          } else {
            d0["range"] = empty_lsp_range();
          }
          lsp_diags.push_back(std::move(d0));
        }
      }

      json notif;
      notif["jsonrpc"] = "2.0";
      notif["method"] = "textDocument/publishDiagnostics";
      notif["params"] = json{{"uri", doc.uri}, {"diagnostics", lsp_diags}};
      write_message(notif);
    };

    auto pos_to_byte_offset = [&](const DocState & doc, const json & pos) -> uint32_t {
      const auto line = pos.value<uint32_t>("line", 0U);
      const auto character = pos.value<uint32_t>("character", 0U);
      const auto off =
        lsp_position_to_byte_offset(doc, line, character, negotiated_position_encoding);
      return off.value_or(0);
    };

    // Workspace folder for the scan requests; an explicit "root" param wins.
    auto scan_root = [&](const json & params) -> std::string {
      const std::string root = params.value("root", "");
      return root.empty() ? root_dir : root;
    };

    bool running = true;
    while (running) {
      const auto msg_opt = read_message();
      if (!msg_opt) {
        if (!std::cin.good()) {
          break;
        }
        continue;
      }

      const json & msg = *msg_opt;
      const std::string method = msg.value("method", "");
      const bool is_request = msg.contains("id");

      auto respond = [&](const json & id, const json & result) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = id;
        resp["result"] = result;
        write_message(resp);
      };

      auto respond_error = [&](const json & id, int code, std::string message) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = id;
        resp["error"] = json{{"code", code}, {"message", std::move(message)}};
        write_message(resp);
      };

      const json params = msg.value("params", json::object());

      if (method == "initialize" && is_request) {
        // Determine position encoding
        negotiated_position_encoding = "utf-8";
        if (params.contains("capabilities") && params["capabilities"].is_object()) {
          const auto & caps = params["capabilities"];
          if (caps.contains("general") && caps["general"].is_object()) {
            const auto & gen = caps["general"];
            if (gen.contains("positionEncodings") && gen["positionEncodings"].is_array()) {
              bool has_utf8 = false;
              bool has_utf16 = false;
              for (const auto & e : gen["positionEncodings"]) {
                if (!e.is_string()) continue;
                const auto s = e.get<std::string>();
                if (s == "utf-8") has_utf8 = true;
                if (s == "utf-16") has_utf16 = true;
              }
              if (!has_utf8 && has_utf16) {
                negotiated_position_encoding = "utf-16";
              }
            }
          }
        }

        // Workspace root and its java_lens.yaml
        if (params.contains("rootUri") && params["rootUri"].is_string()) {
          if (auto p = java_lens::file_uri_to_path(params["rootUri"].get<std::string>())) {
            root_dir = p->string();
          }
        }
        if (!root_dir.empty()) {
          if (auto cfg_path = java_lens::find_project_config(root_dir)) {
            auto loaded = java_lens::load_project_config(*cfg_path);
            if (loaded.success) {
              ws.set_project_config(std::move(loaded.config));
            } else {
              std::cerr << "java_lens_lsp_server: " << loaded.error << "\n";
            }
          }
        }

        json caps;
        caps["positionEncoding"] = negotiated_position_encoding;
        caps["textDocumentSync"] = json{{"openClose", true}, {"change", 1}};  // Full sync
        caps["definitionProvider"] = true;
        caps["documentSymbolProvider"] = true;

        const json result = json{
          {"capabilities", caps}, {"serverInfo", json{{"name", "java_lens_lsp_server"}}}};
        respond(msg["id"], result);
        continue;
      }

      if (method == "initialized") {
        // no-op
        continue;
      }

      if (method == "shutdown" && is_request) {
        cancel.cancel();
        respond(msg["id"], json());
        continue;
      }

      if (method == "exit") {
        running = false;
        continue;
      }

      if (method == "textDocument/didOpen") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        const std::string text = td.value("text", "");
        const std::string language_id = td.value("languageId", "java");
        if (!uri.empty()) {
          publish_diagnostics(upsert_doc(uri, text, language_id));
        }
        continue;
      }

      if (method == "textDocument/didChange") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (uri.empty()) {
          continue;
        }

        // Full sync: take first change text
        const auto changes = params.value("contentChanges", json::array());
        if (!changes.is_array() || changes.empty()) {
          continue;
        }
        const auto & c0 = changes.at(0);
        if (!c0.is_object() || !c0.contains("text") || !c0["text"].is_string()) {
          continue;
        }

        // Keep the language the document was opened with
        auto prev = docs.find(uri);
        const std::string language_id = prev != docs.end() ? prev->second.language_id : "java";

        publish_diagnostics(upsert_doc(uri, c0["text"].get<std::string>(), language_id));
        continue;
      }

      if (method == "textDocument/didClose") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (!uri.empty()) {
          ws.remove_document(uri);
          docs.erase(uri);

          // Clear diagnostics on close
          json notif;
          notif["jsonrpc"] = "2.0";
          notif["method"] = "textDocument/publishDiagnostics";
          notif["params"] = json{{"uri", uri}, {"diagnostics", json::array()}};
          write_message(notif);
        }
        continue;
      }

      if (method == "textDocument/definition" && is_request) {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        const auto pos = params.value("position", json::object());
        auto it = docs.find(uri);
        if (it == docs.end()) {
          respond(msg["id"], json::array());
          continue;
        }
        const uint32_t off = pos_to_byte_offset(it->second, pos);

        const json dj =
          parse_payload(ws.definition_json(uri, off, root_dir, &cancel), json::object());

        json locs = json::array();
        if (dj.contains("locations") && dj["locations"].is_array()) {
          for (const auto & loc : dj["locations"]) {
            if (!loc.is_object()) continue;
            json out;
            out["uri"] = loc.value("uri", "");
            if (loc.contains("range") && loc["range"].is_object()) {
              std::optional<DocState> target;
              if (negotiated_position_encoding == "utf-16") {
                target = load_target_doc(docs, out["uri"].get<std::string>());
              }
              out["range"] = to_lsp_range_from_full_range(
                loc["range"], target ? &*target : nullptr, negotiated_position_encoding);
            } else {
              out["range"] = empty_lsp_range();
            }
            locs.push_back(std::move(out));
          }
        }

        respond(msg["id"], locs);
        continue;
      }

      if (method == "textDocument/documentSymbol" && is_request) {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");

        const json sj =
          parse_payload(ws.document_symbols_json(uri), json{{"symbols", json::array()}});
        const auto doc_it = docs.find(uri);
        const DocState * doc = doc_it != docs.end() ? &doc_it->second : nullptr;

        json out = json::array();
        if (sj.contains("symbols") && sj["symbols"].is_array()) {
          for (const auto & s0 : sj["symbols"]) {
            if (!s0.is_object()) continue;
            json ds;
            ds["name"] = s0.value("name", "");
            ds["kind"] = symbol_kind(s0.value("kind", ""));
            ds["detail"] = s0.value("detail", "");
            if (s0.contains("range") && s0["range"].is_object()) {
              ds["range"] =
                to_lsp_range_from_full_range(s0["range"], doc, negotiated_position_encoding);
              ds["selectionRange"] = ds["range"];
            } else {
              ds["range"] = empty_lsp_range();
              ds["selectionRange"] = ds["range"];
            }
            ds["children"] = json::array();
            out.push_back(std::move(ds));
          }
        }

        respond(msg["id"], out);
        continue;
      }

      if (method == "javaLens/classSummary" && is_request) {
        const std::string uri = params.value("textDocument", json::object()).value("uri", "");
        respond(msg["id"], parse_payload(ws.class_summary_json(uri), nullptr));
        continue;
      }

      if (method == "javaLens/methodCallGraph" && is_request) {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        auto it = docs.find(uri);
        if (it == docs.end()) {
          respond(msg["id"], json{{"uri", uri}, {"status", "unavailable"}, {"graph", nullptr}});
          continue;
        }
        const uint32_t off = pos_to_byte_offset(it->second, params.value("position", json::object()));
        respond(msg["id"], parse_payload(ws.method_call_graph_json(uri, off), nullptr));
        continue;
      }

      if (method == "javaLens/systemServices" && is_request) {
        const std::string root = scan_root(params);
        cancel.reset();
        respond(msg["id"], parse_payload(ws.system_services_scan_json(root, &cancel), nullptr));
        continue;
      }

      if (method == "javaLens/lifecycleTimeline" && is_request) {
        const std::string root = scan_root(params);
        cancel.reset();
        respond(msg["id"], parse_payload(ws.lifecycle_timelines_scan_json(root, &cancel), nullptr));
        continue;
      }

      // Unknown method
      if (is_request) {
        respond_error(msg["id"], -32601, "Method not found");
      }
    }

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "java_lens_lsp_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
