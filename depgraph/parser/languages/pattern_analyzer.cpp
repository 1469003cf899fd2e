#include "pattern_analyzer.hpp"
#include <algorithm>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Regex.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace depgraph::parser::languages {

struct PatternAnalyzer::Compiled {
    std::vector<llvm::Regex> imports;
    std::vector<llvm::Regex> functions;
    std::vector<llvm::Regex> classes;
};

namespace {

std::vector<llvm::Regex> compile(const std::vector<std::string> &patterns) {
    std::vector<llvm::Regex> compiled;
    compiled.reserve(patterns.size());
    for (const auto &pattern : patterns) {
        compiled.emplace_back(pattern);
    }
    return compiled;
}

bool all_valid(const std::string &language,
               const std::vector<std::string> &sources,
               const std::vector<llvm::Regex> &compiled) {
    for (size_t i = 0; i < compiled.size(); ++i) {
        std::string error;
        if (!compiled[i].isValid(error)) {
            spdlog::error("Invalid {} pattern '{}': {}", language, sources[i], error);
            return false;
        }
    }
    return true;
}

// Every non-overlapping match of each pattern, pattern by pattern. The
// matcher keeps no per-character stack, so input size is not a concern.
std::vector<std::string> find_all(const std::vector<llvm::Regex> &patterns, const std::string &content) {
    std::vector<std::string> matches;
    for (const auto &pattern : patterns) {
        llvm::StringRef rest(content);
        llvm::SmallVector<llvm::StringRef, 4> groups;
        while (!rest.empty() && pattern.match(rest, &groups)) {
            llvm::StringRef whole = groups.front();
            matches.push_back(groups.back().str());

            size_t consumed = static_cast<size_t>(whole.data() - rest.data()) + std::max<size_t>(whole.size(), 1);
            rest = rest.drop_front(consumed);
        }
    }
    return matches;
}

} // namespace

PatternSet javascript_patterns() {
    PatternSet set;
    set.language = "javascript";
    set.extensions = {"js", "jsx", "mjs", "cjs"};
    set.import_patterns = {
        R"(import[[:space:]]+(\{[^}]*\}|\*[[:space:]]+as[[:space:]]+[[:alnum:]_]+|[[:alnum:]_]+)[[:space:]]+from[[:space:]]+['"`]([^'"`]+)['"`])",
        R"(require[[:space:]]*\([[:space:]]*['"`]([^'"`]+)['"`])"
    };
    set.function_patterns = {R"(function[[:space:]]+([[:alnum:]_]+)[[:space:]]*\()"};
    set.class_patterns = {R"(class[[:space:]]+([[:alnum:]_]+))"};
    return set;
}

PatternSet typescript_patterns() {
    PatternSet set = javascript_patterns();
    set.language = "typescript";
    set.extensions = {"ts", "tsx", "mts", "cts"};
    return set;
}

PatternAnalyzer::PatternAnalyzer(PatternSet patterns)
    : patterns_(std::move(patterns)) {
    auto compiled = std::make_shared<Compiled>();
    compiled->imports = compile(patterns_.import_patterns);
    compiled->functions = compile(patterns_.function_patterns);
    compiled->classes = compile(patterns_.class_patterns);
    compiled_ = std::move(compiled);
}

PatternAnalyzer::PatternAnalyzer(PatternSet patterns, std::shared_ptr<const Compiled> compiled)
    : patterns_(std::move(patterns)), compiled_(std::move(compiled)) {}

std::unique_ptr<LanguageAnalyzer> PatternAnalyzer::clone() const {
    return std::unique_ptr<LanguageAnalyzer>(new PatternAnalyzer(patterns_, compiled_));
}

bool PatternAnalyzer::initialize() {
    return all_valid(patterns_.language, patterns_.import_patterns, compiled_->imports) &&
           all_valid(patterns_.language, patterns_.function_patterns, compiled_->functions) &&
           all_valid(patterns_.language, patterns_.class_patterns, compiled_->classes);
}

model::FileAnalysis PatternAnalyzer::analyze(const ParserContext &context) {
    model::FileAnalysis result;

    try {
        add_units(find_all(compiled_->functions, context.file_content), model::NodeKind::function, context, result);
        add_units(find_all(compiled_->classes, context.file_content), model::NodeKind::class_, context, result);

        for (auto &target : find_all(compiled_->imports, context.file_content)) {
            model::CodeDependency edge;
            edge.source = context.module_name;
            edge.target = std::move(target);
            edge.kind = model::DependencyKind::imports;
            result.edges.push_back(std::move(edge));
        }
    } catch (const std::exception &e) {
        spdlog::warn("Pattern matching failed in {}: {}", context.file_path, e.what());
        result.parse_error = e.what();
    }

    spdlog::debug("{}: {} node(s), {} edge(s) by pattern", context.file_path,
                  result.nodes.size(), result.edges.size());
    return result;
}

std::vector<std::string> PatternAnalyzer::get_extensions() const {
    return patterns_.extensions;
}

std::string PatternAnalyzer::get_language_name() const {
    return patterns_.language;
}

void PatternAnalyzer::add_units(const std::vector<std::string> &names,
                                model::NodeKind kind,
                                const ParserContext &context,
                                model::FileAnalysis &result) const {
    for (const auto &name : names) {
        model::CodeNode node;
        node.id = model::make_node_id(context.module_name, name);
        node.name = name;
        node.kind = kind;
        node.language = patterns_.language;
        node.path = context.file_path;
        node.line = 0;
        node.complexity = 1.0;
        node.lines_of_code = 0;
        result.nodes.push_back(std::move(node));
    }
}

} // namespace depgraph::parser::languages
