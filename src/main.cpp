#include <memory>
#include <string>
#include <vector>

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include "kaleido/char_source.h"
#include "kaleido/driver.h"
#include "kaleido/lexer.h"
#include "kaleido/parser.h"
#include "kaleido/precedence.h"

using namespace llvm;

static cl::OptionCategory KaleidoCategory("kaleido options");

static cl::list<std::string> InputText(cl::Positional, cl::ZeroOrMore,
                                       cl::desc("<program text>... (put -- before text starting with '-')"),
                                       cl::cat(KaleidoCategory));

static cl::opt<std::string> InputFile("input-file",
                                      cl::desc("Read the program from a file ('-' for stdin)"),
                                      cl::value_desc("path"),
                                      cl::cat(KaleidoCategory));
static cl::alias InputFileA("i", cl::desc("Alias for --input-file"),
                            cl::aliasopt(InputFile),
                            cl::cat(KaleidoCategory));

static cl::opt<bool> DumpAST("dump-ast",
                             cl::desc("Print each parsed construct"),
                             cl::cat(KaleidoCategory));

static cl::opt<bool> ShowStats("stats",
                               cl::desc("Print construct counts at the end"),
                               cl::cat(KaleidoCategory));

//===----------------------------------------------------------------------===//
// Main driver code.
//===----------------------------------------------------------------------===//

int main(int argc, char** argv) {
    InitLLVM X(argc, argv);
    cl::HideUnrelatedOptions(KaleidoCategory);
    cl::ParseCommandLineOptions(argc, argv, "Kaleidoscope front-end\n");

    std::unique_ptr<kaleido::CharSource> source;
    if (InputFile == "-") {
        source = std::make_unique<kaleido::StdinSource>();
    } else if (!InputFile.empty()) {
        ErrorOr<std::unique_ptr<MemoryBuffer>> bufOrErr = MemoryBuffer::getFile(InputFile);
        if (std::error_code ec = bufOrErr.getError()) {
            errs() << "Could not open file " << InputFile << ": " << ec.message() << "\n";
            return 1;
        }
        source = std::make_unique<kaleido::BufferSource>(std::move(*bufOrErr));
    } else {
        std::vector<std::string> inputs(InputText.begin(), InputText.end());
        source = std::make_unique<kaleido::BufferSource>(
            kaleido::BufferSource::fromInputs(inputs));
    }

    kaleido::PrecedenceTable binopPrecedence;
    kaleido::Lexer lexer(*source);
    kaleido::Parser parser(lexer, binopPrecedence);

    kaleido::DriverOptions opts;
    opts.dumpAST = DumpAST;
    kaleido::Driver driver(parser, errs(), opts);

    // Run the main "interpreter loop" now.
    kaleido::DriverStats stats = driver.mainLoop();
    if (ShowStats) kaleido::printStats(errs(), stats);

    return 0;
}
