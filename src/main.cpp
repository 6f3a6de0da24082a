#include "compiler/debug/debugCompiler.hpp"
#include "compiler/errors.hpp"
#include "compiler/patternCompiler.hpp"
#include "lexer/lexer.hpp"
#include "pattern/patternParser.hpp"
#include "source/sourceParser.hpp"
#include "visualizer/colorizer.hpp"

#include <llvm/Support/raw_ostream.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

struct CliOptions {
    std::string command;
    std::string pattern;
    std::string source;
    bool trace = false;
    bool debug = false;
    bool json = false;
    bool color = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " tokenize <pattern>\n";
    std::cerr << "       " << program << " parse <pattern>\n";
    std::cerr << "       " << program << " compile [--trace] <pattern>\n";
    std::cerr << "       " << program << " test [--json] [--color] <pattern> <source|@file>\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --trace      Compile with trace instrumentation\n";
    std::cerr << "  --json       Print test results as JSON\n";
    std::cerr << "  --color      Color the source even when not writing to a terminal\n";
    std::cerr << "  --debug      Enable debug logging\n";
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

llvm::raw_ostream::Colors colorFor(treepat::DisplayAttribute attribute) {
    switch (attribute) {
        case treepat::DisplayAttribute::NotVisited: return llvm::raw_ostream::YELLOW;
        case treepat::DisplayAttribute::Failed: return llvm::raw_ostream::RED;
        case treepat::DisplayAttribute::Matched: return llvm::raw_ostream::GREEN;
        default: return llvm::raw_ostream::CYAN;
    }
}

void tokenize(const CliOptions& options) {
    treepat::Lexer lexer(options.pattern);
    for (const treepat::Token& token : lexer.tokenize()) {
        llvm::outs() << token.toString() << "\n";
    }
}

void parse(const CliOptions& options) {
    treepat::PatternNodePtr pattern = treepat::PatternParser(options.pattern).parse();
    llvm::outs() << pattern->toString() << "\n";
}

void compile(const CliOptions& options) {
    treepat::PatternNodePtr pattern = treepat::PatternParser(options.pattern).parse();

    treepat::CompilerOptions compilerOptions;
    compilerOptions.debug = options.debug;
    std::unique_ptr<treepat::PatternCompiler> compiler;
    if (options.trace) {
        compiler = std::make_unique<treepat::DebugCompiler>(std::move(compilerOptions));
    } else {
        compiler = std::make_unique<treepat::PatternCompiler>(std::move(compilerOptions));
    }

    treepat::CompiledMatcher matcher = compiler->compile(*pattern);
    llvm::outs() << matcher.toString() << "\n";
}

// Source text with every character colored by its display attribute
void printColored(const treepat::ColorizerResult& result) {
    llvm::raw_ostream& out = llvm::outs();
    const std::string& text = result.tree().buffer->text();
    std::vector<treepat::DisplayAttribute> colors = result.colorMap();

    for (size_t offset = 0; offset < text.size();) {
        size_t end = offset + 1;
        while (end < text.size() && colors[end] == colors[offset]) {
            end++;
        }
        out.changeColor(colorFor(colors[offset]));
        out << text.substr(offset, end - offset);
        offset = end;
    }
    out.resetColor();
    out << "\n";
}

void test(const CliOptions& options) {
    std::string source = options.source;
    std::string name = "(source)";
    if (!source.empty() && source[0] == '@') {
        name = source.substr(1);
        source = readFile(name);
    }

    treepat::CompilerOptions compilerOptions;
    compilerOptions.debug = options.debug;
    treepat::Colorizer colorizer(options.pattern, std::move(compilerOptions));
    treepat::ColorizerResult result =
        colorizer.test(treepat::SourceParser(source, name).parse());

    if (options.json) {
        llvm::outs() << result.toJson().dump(2) << "\n";
        return;
    }

    llvm::raw_ostream& out = llvm::outs();
    out << "matched: " << (result.returned().matched ? "true" : "false") << "\n";
    const treepat::ValueList& captures = result.returned().captures;
    for (size_t index = 0; index < captures.size(); index++) {
        out << "capture " << index << ": " << captures[index].toString() << "\n";
    }

    const treepat::NodeIds& ids = colorizer.nodeIds();
    for (treepat::NodeId id = 0; id < ids.size(); id++) {
        const treepat::PatternNode& node = ids.node(id);
        treepat::DisplayAttribute attribute =
            treepat::displayAttributeFor(result.trace().matched(id));
        out << "  [" << id << "] "
            << colorizer.pattern().substr(node.range.begin, node.range.size())
            << ": " << treepat::displayAttributeToString(attribute) << "\n";
    }

    if (options.color) {
        out.enable_colors(true);
    }
    printColored(result);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    CliOptions options;
    std::vector<std::string> positional;
    for (int argIndex = 1; argIndex < argc; argIndex++) {
        std::string arg = argv[argIndex];
        if (arg == "--trace") {
            options.trace = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--color") {
            options.color = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    options.command = positional[0];
    size_t expected = options.command == "test" ? 3 : 2;
    if (positional.size() != expected) {
        std::cerr << "Error: '" << options.command << "' expects "
                  << (expected == 3 ? "a pattern and a source" : "a pattern") << "\n";
        return 1;
    }
    options.pattern = positional[1];
    if (expected == 3) {
        options.source = positional[2];
    }

    try {
        if (options.command == "tokenize") {
            tokenize(options);
        } else if (options.command == "parse") {
            parse(options);
        } else if (options.command == "compile") {
            compile(options);
        } else if (options.command == "test") {
            test(options);
        } else {
            std::cerr << "Error: unknown command '" << options.command << "'\n";
            printUsage(argv[0]);
            return 1;
        }
        return 0;
    } catch (const treepat::TreepatError& e) {
        llvm::outs().flush();
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        llvm::outs().flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
