#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/TextExtractor.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CommandLineExtractionStrategy.hpp"
#include "infrastructure/PlainTextExtractionStrategy.hpp"

using namespace versionlens;

namespace {
    class FixedStrategy : public domain::TextExtractionStrategy {
    public:
        FixedStrategy(std::string name, std::string output, bool fail = false)
            : m_name(std::move(name)), m_output(std::move(output)), m_fail(fail) {}

        std::string name() const override { return m_name; }

        std::string extract(const std::string&) override {
            ++calls;
            if (m_fail) throw std::runtime_error("tool crashed");
            return m_output;
        }

        int calls = 0;

    private:
        std::string m_name;
        std::string m_output;
        bool m_fail;
    };
}

int main() {
    std::cout << "[Test] Starting TextExtractor Test..." << std::endl;

    // Falls through failing and empty strategies, stops at the first usable one
    {
        auto broken = std::make_shared<FixedStrategy>("broken", "", true);
        auto blank = std::make_shared<FixedStrategy>("scanned", " \n\f \n");
        auto good = std::make_shared<FixedStrategy>("good", "Line one\r\nLine two\fPage two");
        auto unused = std::make_shared<FixedStrategy>("unused", "never");

        application::TextExtractor extractor({broken, blank, good, unused});
        auto doc = extractor.extract("bytes", "3424/Output/v1.pdf");
        assert(doc.versionId == "3424/Output/v1.pdf");
        assert(doc.extractionMethod == "good");
        assert(doc.rawText == "Line one\nLine two\nPage two");
        assert(broken->calls == 1 && blank->calls == 1 && good->calls == 1);
        assert(unused->calls == 0);
        std::cout << "[PASS] Fallback chain order." << std::endl;
    }

    // Every strategy failing yields one ExtractionError listing all attempts
    {
        application::TextExtractor extractor({
            std::make_shared<FixedStrategy>("pdftotext", "", true),
            std::make_shared<FixedStrategy>("mutool", "   ")
        });
        bool threw = false;
        try {
            extractor.extract("bytes", "v2");
        } catch (const domain::ExtractionError& e) {
            threw = true;
            assert(e.attempts().size() == 2);
            assert(e.attempts()[0] == "pdftotext: tool crashed");
            assert(e.attempts()[1] == "mutool: no text layer");
            assert(std::string(e.what()).find("v2") != std::string::npos);
        }
        assert(threw);

        bool emptyChainThrew = false;
        try {
            application::TextExtractor emptyChain(std::vector<std::shared_ptr<domain::TextExtractionStrategy>>{});
            emptyChain.extract("bytes", "v3");
        } catch (const domain::ExtractionError& e) {
            emptyChainThrew = e.attempts().size() == 1;
        }
        assert(emptyChainThrew);
        std::cout << "[PASS] ExtractionError reports each attempt." << std::endl;
    }

    // Plain-text passthrough refuses PDF and binary payloads
    {
        application::TextExtractor extractor({std::make_shared<infrastructure::PlainTextExtractionStrategy>()});
        assert(extractor.extract("Section 1: A\nbody", "t").extractionMethod == "text-read");

        bool pdfRejected = false;
        try {
            extractor.extract("%PDF-1.4\n...", "p");
        } catch (const domain::ExtractionError&) {
            pdfRejected = true;
        }
        assert(pdfRejected);

        bool binaryRejected = false;
        try {
            extractor.extract(std::string("ab\0cd", 5), "b");
        } catch (const domain::ExtractionError&) {
            binaryRejected = true;
        }
        assert(binaryRejected);
        std::cout << "[PASS] Plain-text strategy." << std::endl;
    }

    // External commands: output captured, non-zero exit is a failure
    {
        infrastructure::CommandLineExtractionStrategy cat("cat", "cat {input}");
        assert(cat.isAvailable());
        assert(cat.extract("hello\nworld") == "hello\nworld");

        infrastructure::CommandLineExtractionStrategy failing("false", "false {input}");
        bool failed = false;
        try {
            failing.extract("x");
        } catch (const std::runtime_error&) {
            failed = true;
        }
        assert(failed);

        infrastructure::CommandLineExtractionStrategy missing("missing", "versionlens-no-such-tool {input}");
        assert(!missing.isAvailable());

        bool rejected = false;
        try {
            infrastructure::CommandLineExtractionStrategy("bad", "pdftotext -");
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        assert(rejected);
        std::cout << "[PASS] Command-line strategy." << std::endl;
    }

    {
        assert(application::TextExtractor::NormalizeText("a\rb\r\nc\fd") == "a\nb\nc\nd");
        std::cout << "[PASS] NormalizeText." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
