#include "language_registry.hpp"
#include "extraction_errors.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

// Grammars linked from the installed tree-sitter parser libraries (global scope).
extern "C" {
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
    const TSLanguage* tree_sitter_java();
    const TSLanguage* tree_sitter_c();
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_go();
    const TSLanguage* tree_sitter_rust();
    const TSLanguage* tree_sitter_bash();
}

namespace code_extraction {

namespace fs = std::filesystem;

const char* to_string(LanguageFamily family) {
    switch (family) {
        case LanguageFamily::CLike: return "c_like";
        case LanguageFamily::Scripting: return "scripting";
        case LanguageFamily::Markup: return "markup";
        case LanguageFamily::Data: return "data";
        case LanguageFamily::Config: return "config";
        case LanguageFamily::Log: return "log";
    }
    return "unknown";
}

namespace {

HeuristicRule rule(std::string pattern, double weight, bool icase = false) {
    return HeuristicRule{std::move(pattern), weight, icase, std::regex{}};
}

// Shared per-family rules. Profile signatures are appended after these.
std::vector<HeuristicRule> family_rules(LanguageFamily family) {
    switch (family) {
        case LanguageFamily::CLike:
            return {
                rule(R"([;{}]\s*$)", 1.0),
                rule(R"(^\s*(if|for|while|switch)\s*\()", 1.0),
                rule(R"(^\s*(return|break|continue)\b)", 0.8),
                rule(R"(^\s*(//|/\*|\*/))", 0.5),
                rule(R"(\w+\s*\([^()]*\)\s*[{;]?\s*$)", 0.5),
            };
        case LanguageFamily::Scripting:
            return {
                rule(R"(^\s*(if|elif|while|for|until|unless)\b.*(:|then|do)\s*$)", 1.0),
                rule(R"(^\s*(return|end|fi|done|esac)\b)", 0.8),
                rule(R"(^\s*\w+\s*=\s*\S)", 0.5),
                rule(R"(^\s*#\s)", 0.3),
            };
        case LanguageFamily::Markup:
            return {
                rule(R"(<[A-Za-z][\w:.-]*(\s[^<>]*)?/?>)", 1.2),
                rule(R"(</[A-Za-z][\w:.-]*\s*>)", 1.2),
                rule(R"(^\s*<!--|-->\s*$)", 0.5),
            };
        case LanguageFamily::Data:
            return {
                rule(R"(^\s*"[^"]+"\s*:)", 1.2),
                rule(R"(^\s*[\w.-]+\s*:(\s|$))", 0.8),
                rule(R"(^\s*-\s+\S)", 0.5),
                rule(R"(^\s*[\[\]{}],?\s*$)", 0.8),
            };
        case LanguageFamily::Config:
            return {
                rule(R"(^\s*[\w.-]+\s+[^\s;]+.*;\s*$)", 0.8),
                rule(R"(^\s*[\w.-]+\s*=\s*\S)", 0.8),
                rule(R"(^\s*\[[\w .-]+\]\s*$)", 1.0),
                rule(R"(^\s*[#!])", 0.3),
            };
        case LanguageFamily::Log:
            return {
                rule(R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2})", 1.5),
                rule(R"(\b(DEBUG|INFO|WARN|WARNING|ERROR|ERR|CRITICAL|FATAL|TRACE)\b)", 1.0),
                rule(R"(\b(\d{1,3}\.){3}\d{1,3}\b)", 0.3),
            };
    }
    return {};
}

struct ProfileDef {
    std::string id;
    std::string display_name;
    LanguageFamily family;
    std::vector<std::string> extensions;
    std::vector<std::string> filenames;
    std::vector<std::string> shebangs;
    std::vector<std::string> fence_aliases;
    std::vector<HeuristicRule> signatures;
    GrammarAdapter grammar;
};

LanguageProfile make_profile(ProfileDef def) {
    LanguageProfile p;
    p.id = std::move(def.id);
    p.display_name = std::move(def.display_name);
    p.family = def.family;
    p.extensions = std::move(def.extensions);
    p.filenames = std::move(def.filenames);
    p.shebangs = std::move(def.shebangs);
    p.fence_aliases = std::move(def.fence_aliases);
    p.signatures = std::move(def.signatures);
    p.grammar = def.grammar;
    p.fallback.family = def.family;
    p.fallback.rules = family_rules(def.family);
    p.fallback.rules.insert(p.fallback.rules.end(), p.signatures.begin(), p.signatures.end());
    return p;
}

void compile(HeuristicRule& r, const std::string& owner) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (r.icase) flags |= std::regex::icase;
    try {
        r.regex = std::regex(r.pattern, flags);
    } catch (const std::regex_error& e) {
        throw ConfigError("Language profile '" + owner + "': bad pattern '" + r.pattern + "': " + e.what());
    }
}

void insert_key(std::unordered_map<std::string, size_t>& map, const std::string& key,
                size_t index, const std::string& kind, const std::string& owner) {
    auto [it, inserted] = map.emplace(key, index);
    if (!inserted) {
        throw ConfigError("Duplicate " + kind + " '" + key + "' in language profile '" + owner + "'");
    }
}

std::string strip_version(std::string name) {
    while (!name.empty() && (std::isdigit(static_cast<unsigned char>(name.back())) || name.back() == '.')) {
        name.pop_back();
    }
    return name;
}

const std::vector<std::string> kDocumentExtensions = {
    ".txt", ".text", ".md", ".markdown", ".rst", ".log", ".docx", ".pdf"
};

} // namespace

std::vector<LanguageProfile> default_language_profiles() {
    using F = LanguageFamily;
    std::vector<LanguageProfile> table;

    table.push_back(make_profile({"python", "Python", F::Scripting,
        {".py", ".pyw", ".pyi"}, {}, {"python"}, {"py", "python3", "py3"},
        {rule(R"(^\s*def\s+\w+\s*\(.*\)\s*(->\s*[^:]+)?:\s*$)", 2.0),
         rule(R"(^\s*class\s+\w+\s*(\(.*\))?\s*:\s*$)", 2.0),
         rule(R"(^\s*(from\s+[\w.]+\s+)?import\s+[\w.]+)", 1.5),
         rule(R"(^\s*(elif|except|finally|with)\b.*:\s*$)", 1.5),
         rule(R"(\bself\.\w+)", 1.0),
         rule(R"(^\s*@\w+)", 0.5),
         rule(R"(\b(None|True|False)\b)", 0.3)},
        TreeSitterGrammar{tree_sitter_python}}));

    table.push_back(make_profile({"javascript", "JavaScript", F::CLike,
        {".js", ".jsx", ".mjs", ".cjs"}, {}, {"node", "nodejs"}, {"js", "jsx", "node", "mjs"},
        {rule(R"(\b(const|let|var)\s+\w+\s*=)", 1.5),
         rule(R"(\bfunction\s*\w*\s*\()", 1.5),
         rule(R"(=>\s*[{(]?)", 1.0),
         rule(R"(\b(require\(|module\.exports|console\.log))", 1.5),
         rule(R"(^\s*import\s+.*\s+from\s+['"])", 1.2),
         rule(R"(^\s*export\s+(default\s+)?(function|class|const))", 1.2)},
        TreeSitterGrammar{tree_sitter_javascript}}));

    table.push_back(make_profile({"typescript", "TypeScript", F::CLike,
        {".ts", ".mts", ".cts"}, {}, {"ts-node"}, {"ts"},
        {rule(R"(:\s*(string|number|boolean|any|void|unknown)\b)", 1.5),
         rule(R"(^\s*(export\s+)?(interface|type)\s+\w+)", 1.5),
         rule(R"(\b(const|let)\s+\w+\s*:\s*\w+)", 1.0),
         rule(R"(^\s*import\s+.*\s+from\s+['"])", 1.0),
         rule(R"(\b(private|public|readonly)\s+\w+\s*:)", 1.0)},
        TreeSitterGrammar{tree_sitter_typescript}}));

    table.push_back(make_profile({"tsx", "TSX", F::CLike,
        {".tsx"}, {}, {}, {},
        {rule(R"(^\s*import\s+.*from\s+['"]react['"])", 2.0),
         rule(R"(<[A-Z]\w*[\s/>])", 1.0),
         rule(R"(:\s*(string|number|boolean|React\.\w+)\b)", 1.0),
         rule(R"(return\s*\(\s*$)", 0.5)},
        TreeSitterGrammar{tree_sitter_tsx}}));

    table.push_back(make_profile({"java", "Java", F::CLike,
        {".java"}, {}, {}, {},
        {rule(R"(^\s*(public|private|protected)\s+(static\s+)?(final\s+)?[\w<>\[\]]+\s+\w+\s*\()", 2.0),
         rule(R"(^\s*(public\s+)?(abstract\s+)?(class|interface|enum)\s+\w+)", 1.5),
         rule(R"(System\.out\.print)", 2.0),
         rule(R"(^\s*package\s+[\w.]+;)", 2.0),
         rule(R"(^\s*import\s+[\w.]+(\.\*)?;)", 1.5),
         rule(R"(@Override\b)", 1.5)},
        TreeSitterGrammar{tree_sitter_java}}));

    table.push_back(make_profile({"c", "C", F::CLike,
        {".c", ".h"}, {}, {}, {},
        {rule(R"(^\s*#\s*include\s*[<"])", 2.0),
         rule(R"(\b(printf|malloc|free|sizeof|fprintf)\s*\()", 1.2),
         rule(R"(^\s*(int|void|char|float|double|long|unsigned|static|struct)\b[\w\s\*]*\()", 1.5),
         rule(R"(\bstruct\s+\w+\s*\{)", 1.0),
         rule(R"(^\s*#\s*define\s+\w+)", 1.5)},
        TreeSitterGrammar{tree_sitter_c}}));

    table.push_back(make_profile({"cpp", "C++", F::CLike,
        {".cpp", ".cc", ".cxx", ".hpp", ".hh", ".hxx", ".ipp"}, {}, {}, {"c++", "cxx", "cc", "hpp"},
        {rule(R"(^\s*#\s*include\s*[<"])", 1.5),
         rule(R"(\bstd::)", 2.0),
         rule(R"(^\s*(template\s*<|namespace\s+\w+|using\s+namespace\b))", 2.0),
         rule(R"(^\s*(class|struct)\s+\w+\s*(:\s*(public|private|protected)\s+\w+)?\s*\{?\s*$)", 1.0),
         rule(R"(\b(auto|nullptr|constexpr|virtual|override)\b)", 1.0)},
        TreeSitterGrammar{tree_sitter_cpp}}));

    table.push_back(make_profile({"go", "Go", F::CLike,
        {".go"}, {}, {}, {"golang"},
        {rule(R"(^\s*package\s+\w+\s*$)", 2.0),
         rule(R"(^\s*func\s+(\(\w+\s+\*?\w+\)\s*)?\w+\s*\()", 2.0),
         rule(R"(:=)", 1.5),
         rule(R"(^\s*import\s*(\(|"))", 1.5),
         rule(R"(\bfmt\.\w+)", 1.5),
         rule(R"(\b(chan|defer|go)\s)", 0.8)},
        TreeSitterGrammar{tree_sitter_go}}));

    table.push_back(make_profile({"rust", "Rust", F::CLike,
        {".rs"}, {}, {}, {"rs"},
        {rule(R"(^\s*(pub\s+)?fn\s+\w+)", 2.0),
         rule(R"(\blet\s+(mut\s+)?\w+)", 1.5),
         rule(R"(^\s*use\s+[\w:]+)", 1.5),
         rule(R"(\b(impl|trait|enum|struct)\s+\w+)", 1.0),
         rule(R"(\w+!\()", 1.5),
         rule(R"(&mut\s+\w+|->\s*\w+)", 0.5)},
        TreeSitterGrammar{tree_sitter_rust}}));

    table.push_back(make_profile({"bash", "Shell", F::Scripting,
        {".sh", ".bash", ".zsh", ".ksh"}, {".bashrc", ".zshrc", ".profile"}, {"bash", "sh", "zsh", "ksh", "dash"},
        {"sh", "shell", "zsh", "console", "shellsession"},
        {rule(R"(^\s*(if|while|until)\s+\[)", 2.0),
         rule(R"(^\s*(fi|done|esac|then|do)\s*$)", 1.5),
         rule(R"(\$\{?\w+\}?)", 1.0),
         rule(R"(^\s*(\$\s+)?(echo|export|cd|source|sudo|apt-get|apt|yum|brew|pip|npm|mkdir|chmod|rm|cp|mv|curl|wget|grep|git)\s)", 1.5),
         rule(R"(^\s*\w+\s*\(\)\s*\{)", 1.5),
         rule(R"(\|\s*\w+)", 0.5)},
        TreeSitterGrammar{tree_sitter_bash}}));

    table.push_back(make_profile({"json", "JSON", F::Data,
        {".json", ".geojson"}, {".babelrc", ".eslintrc"}, {}, {},
        {rule(R"(^\s*[{\[]\s*$)", 1.0),
         rule(R"(^\s*"[^"]+"\s*:\s*)", 2.0)},
        JsonGrammar{}}));

    table.push_back(make_profile({"xml", "XML", F::Markup,
        {".xml", ".xsd", ".xsl", ".svg", ".plist", ".csproj"}, {}, {}, {"svg", "xsd"},
        {rule(R"(^\s*<\?xml)", 3.0),
         rule(R"(^\s*<[\w:.-]+(\s+[\w:.-]+="[^"]*")*\s*/?>)", 1.0),
         rule(R"(\bxmlns(:\w+)?=)", 1.5)},
        XmlGrammar{}}));

    table.push_back(make_profile({"ruby", "Ruby", F::Scripting,
        {".rb", ".rake", ".gemspec"}, {"Gemfile", "Rakefile"}, {"ruby"}, {"rb"},
        {rule(R"(^\s*def\s+\w+[^:]*$)", 1.5),
         rule(R"(^\s*end\s*$)", 1.5),
         rule(R"(\b(puts|require|attr_accessor|attr_reader)\b)", 1.5),
         rule(R"(\bdo\s*(\|[^|]*\|)?\s*$)", 1.5),
         rule(R"(^\s*(module|class)\s+[A-Z]\w*(\s*<\s*\w+)?\s*$)", 1.0)},
        NoGrammar{}}));

    table.push_back(make_profile({"php", "PHP", F::CLike,
        {".php", ".phtml"}, {}, {"php"}, {},
        {rule(R"(<\?php)", 3.0),
         rule(R"(\$\w+\s*=)", 1.5),
         rule(R"(\becho\s)", 1.0),
         rule(R"(->\w+\()", 0.8),
         rule(R"(^\s*(public|private|protected)?\s*function\s+\w+)", 1.5)},
        NoGrammar{}}));

    table.push_back(make_profile({"c_sharp", "C#", F::CLike,
        {".cs"}, {}, {}, {"cs", "csharp", "c#"},
        {rule(R"(^\s*using\s+System)", 2.5),
         rule(R"(^\s*namespace\s+[\w.]+)", 1.5),
         rule(R"(\b(Console\.Write|string\[\])|var\s+\w+\s*=\s*new\b)", 1.5),
         rule(R"(^\s*(public|private|internal)\s+(static\s+)?(async\s+)?[\w<>]+\s+\w+\s*\()", 1.0),
         rule(R"(\{\s*get;\s*(set;)?\s*\})", 2.0)},
        NoGrammar{}}));

    table.push_back(make_profile({"kotlin", "Kotlin", F::CLike,
        {".kt", ".kts"}, {}, {}, {"kt"},
        {rule(R"(^\s*(private\s+|override\s+)?fun\s+\w+\s*\()", 2.0),
         rule(R"(\bval\s+\w+)", 1.5),
         rule(R"(\bvar\s+\w+\s*:)", 1.0),
         rule(R"(^\s*(data\s+)?class\s+\w+\()", 1.5),
         rule(R"(\bprintln\()", 0.8)},
        NoGrammar{}}));

    table.push_back(make_profile({"html", "HTML", F::Markup,
        {".html", ".htm", ".xhtml"}, {}, {}, {"htm", "xhtml"},
        {rule(R"(<!DOCTYPE\s+html)", 3.0, true),
         rule(R"(</?(html|head|body|div|span|p|a|ul|li|script|style|table|form|input)\b)", 1.5, true),
         rule(R"(\b(class|href|src|id)=")", 1.0)},
        NoGrammar{}}));

    table.push_back(make_profile({"css", "CSS", F::CLike,
        {".css", ".scss", ".less"}, {}, {}, {"scss", "less"},
        {rule(R"(^\s*[.#]?[\w-]+(\s*[,>+~]?\s*[.#:]?[\w-]+)*\s*\{\s*$)", 1.5),
         rule(R"(^\s*[\w-]+\s*:\s*[^;]+;\s*$)", 1.5),
         rule(R"(@(media|import|keyframes)\b)", 1.5)},
        NoGrammar{}}));

    table.push_back(make_profile({"sql", "SQL", F::CLike,
        {".sql"}, {}, {}, {"mysql", "postgresql", "psql", "sqlite", "plsql"},
        {rule(R"(^\s*(SELECT|INSERT\s+INTO|UPDATE|DELETE\s+FROM|CREATE\s+(TABLE|INDEX|VIEW)|ALTER\s+TABLE|DROP\s+TABLE)\b)", 2.0, true),
         rule(R"(\b(FROM|WHERE|JOIN|GROUP\s+BY|ORDER\s+BY|VALUES|PRIMARY\s+KEY)\b)", 1.0, true)},
        NoGrammar{}}));

    table.push_back(make_profile({"yaml", "YAML", F::Data,
        {".yaml", ".yml"}, {}, {}, {"yml"},
        {rule(R"(^---\s*$)", 1.5),
         rule(R"(^\s*[\w.-]+:\s*$)", 1.0),
         rule(R"(^\s*[\w.-]+:\s+[^{}\[\];]+$)", 1.0),
         rule(R"(^\s*-\s+[\w.-]+:\s)", 1.0)},
        YamlGrammar{}}));

    table.push_back(make_profile({"ini", "INI", F::Config,
        {".ini", ".cfg", ".config", ".properties"}, {".env", ".gitconfig", ".editorconfig"}, {}, {"cfg", "dotenv", "properties"},
        {rule(R"(^\s*\[[\w .-]+\]\s*$)", 2.0),
         rule(R"(^\s*[\w.-]+\s*=\s*.*$)", 1.0),
         rule(R"(^\s*;)", 0.5)},
        NoGrammar{}}));

    table.push_back(make_profile({"dockerfile", "Dockerfile", F::Config,
        {".dockerfile"}, {"Dockerfile", "Containerfile"}, {}, {"docker"},
        {rule(R"(^\s*(FROM|RUN|CMD|COPY|ADD|ENV|EXPOSE|WORKDIR|ENTRYPOINT|ARG|LABEL|USER|VOLUME)\s)", 2.0)},
        NoGrammar{}}));

    table.push_back(make_profile({"makefile", "Makefile", F::Config,
        {".mk", ".mak"}, {"Makefile", "GNUmakefile"}, {}, {"make", "mk"},
        {rule(R"(^[\w.$()/-]+\s*:([^=]|$))", 1.5),
         rule(R"(^\t\S)", 0.8),
         rule(R"(\$\(\w+\))", 1.0),
         rule(R"(^\s*\w+\s*[:?+]?=)", 1.0)},
        NoGrammar{}}));

    table.push_back(make_profile({"nginx", "Nginx config", F::Config,
        {}, {"nginx.conf"}, {}, {"nginxconf"},
        {rule(R"(^\s*server\s*\{)", 2.0),
         rule(R"(^\s*location\s+[~*^=]*\s*\S+\s*\{)", 2.0),
         rule(R"(^\s*listen\s+\d+)", 1.5),
         rule(R"(proxy_pass\s+https?://)", 1.5),
         rule(R"(^\s*(server_name|root|index|upstream)\s+[^;]+;?)", 1.0)},
        NoGrammar{}}));

    table.push_back(make_profile({"cisco_ios", "Cisco IOS config", F::Config,
        {}, {}, {}, {"cisco", "ios"},
        {rule(R"(access-list\s+\d+\s+(permit|deny))", 2.0, true),
         rule(R"(^\s*vlan\s+\d+)", 1.5, true),
         rule(R"(^\s*interface\s+[A-Za-z]+[\d/.]+)", 1.5, true),
         rule(R"(^\s*router\s+(bgp|ospf|eigrp))", 2.0, true),
         rule(R"(^\s*ip\s+address\s+\d)", 1.5, true),
         rule(R"(^\s*(no\s+)?shutdown\s*$)", 1.0, true)},
        NoGrammar{}}));

    table.push_back(make_profile({"log", "Log output", F::Log,
        {}, {}, {}, {},
        {rule(R"(^\[?\d{4}-\d{2}-\d{2})", 1.0),
         rule(R"(\b(Exception|Traceback|at\s+[\w.$]+\()", 1.0)},
        NoGrammar{}}));

    return table;
}

// --- rule evaluation ---

RuleDensity match_density(const std::vector<const std::vector<HeuristicRule>*>& rule_sets,
                          std::string_view text, size_t max_lines) {
    RuleDensity result;
    double total = 0.0;
    for (std::string_view line : split_lines(text)) {
        if (is_blank(line)) continue;
        if (max_lines && result.scored_lines >= max_lines) break;
        ++result.scored_lines;
        if (line.size() > kMaxRuleLineLength) continue;

        double weight = 0.0;
        for (const auto* rules : rule_sets) {
            for (const auto& r : *rules) {
                if (std::regex_search(line.data(), line.data() + line.size(), r.regex)) weight += r.weight;
            }
        }
        if (weight > 0.0) {
            ++result.matched_lines;
            total += std::min(1.0, weight / 2.0);
        }
    }
    if (result.scored_lines) result.density = total / static_cast<double>(result.scored_lines);
    return result;
}

// --- registry ---

const LanguageRegistry& LanguageRegistry::instance() {
    static const LanguageRegistry registry(default_language_profiles());
    return registry;
}

LanguageRegistry::LanguageRegistry(std::vector<LanguageProfile> profiles) : profiles_(std::move(profiles)) {
    for (size_t i = 0; i < profiles_.size(); ++i) {
        auto& p = profiles_[i];
        if (p.id.empty()) throw ConfigError("Language profile without an id at index " + std::to_string(i));
        if (p.fallback.rules.empty()) throw ConfigError("Language profile '" + p.id + "' has no fallback rules");

        for (auto& r : p.signatures) compile(r, p.id);
        for (auto& r : p.fallback.rules) compile(r, p.id);

        insert_key(by_name_, to_lower(p.id), i, "language id", p.id);
        for (const auto& alias : p.fence_aliases) insert_key(by_name_, to_lower(alias), i, "fence alias", p.id);
        for (const auto& ext : p.extensions) insert_key(by_extension_, to_lower(ext), i, "extension", p.id);
        for (const auto& name : p.filenames) insert_key(by_filename_, to_lower(name), i, "filename", p.id);
        for (const auto& sb : p.shebangs) insert_key(by_shebang_, sb, i, "shebang", p.id);
    }
    spdlog::debug("Language registry ready: {} profiles", profiles_.size());
}

const LanguageProfile* LanguageRegistry::find(std::string_view name) const {
    auto it = by_name_.find(to_lower(trim(name)));
    return it == by_name_.end() ? nullptr : &profiles_[it->second];
}

const LanguageProfile* LanguageRegistry::from_path(const std::string& path) const {
    fs::path p(path);
    auto by_name = by_filename_.find(to_lower(p.filename().string()));
    if (by_name != by_filename_.end()) return &profiles_[by_name->second];

    auto by_ext = by_extension_.find(to_lower(p.extension().string()));
    if (by_ext != by_extension_.end()) return &profiles_[by_ext->second];
    return nullptr;
}

const LanguageProfile* LanguageRegistry::from_shebang(std::string_view text) const {
    if (text.substr(0, 2) != "#!") return nullptr;
    std::string_view first = text.substr(2, text.find('\n') == std::string_view::npos ? text.size() : text.find('\n') - 2);

    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < first.size()) {
        while (i < first.size() && std::isspace(static_cast<unsigned char>(first[i]))) ++i;
        size_t start = i;
        while (i < first.size() && !std::isspace(static_cast<unsigned char>(first[i]))) ++i;
        if (i > start) tokens.emplace_back(first.substr(start, i - start));
    }
    if (tokens.empty()) return nullptr;

    std::string interpreter = fs::path(tokens[0]).filename().string();
    if (interpreter == "env") {
        interpreter.clear();
        for (size_t t = 1; t < tokens.size(); ++t) {
            if (tokens[t].empty() || tokens[t][0] == '-') continue;
            interpreter = tokens[t];
            break;
        }
    }
    if (interpreter.empty()) return nullptr;

    auto it = by_shebang_.find(interpreter);
    if (it == by_shebang_.end()) it = by_shebang_.find(strip_version(interpreter));
    return it == by_shebang_.end() ? nullptr : &profiles_[it->second];
}

bool LanguageRegistry::is_document_path(const std::string& path) const {
    fs::path p(path);
    std::string ext = to_lower(p.extension().string());
    if (std::find(kDocumentExtensions.begin(), kDocumentExtensions.end(), ext) != kDocumentExtensions.end()) {
        return true;
    }
    // Extension-less names (README, NOTES) are prose unless they name a known file type.
    return ext.empty() && by_filename_.find(to_lower(p.filename().string())) == by_filename_.end();
}

double LanguageRegistry::signature_score(const LanguageProfile& profile, std::string_view text) const {
    double score = match_density({&profile.signatures}, text, 400).density;
    if (from_shebang(text) == &profile) score += 1.0;
    return score;
}

std::vector<SignatureScore> LanguageRegistry::rank_by_signature(std::string_view text, bool grammar_only) const {
    std::vector<SignatureScore> ranked;
    for (const auto& p : profiles_) {
        if (grammar_only && !p.has_grammar()) continue;
        double s = signature_score(p, text);
        if (s > 0.0) ranked.push_back({&p, s});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const SignatureScore& a, const SignatureScore& b) { return a.score > b.score; });
    return ranked;
}

} // namespace code_extraction
