#include "cli.hpp"
#include "capacity.hpp"
#include "message_framer.hpp"
#include "metrics.hpp"
#include "stego_error.hpp"
#include "svg_document.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>

namespace svgstego {

    const char* const USAGE_TIP =
        "Usage: \tsvgstego embed path/to/msg.txt path/to/cover.svg stegokey\n"
        "\tsvgstego extract path/to/stego-object.svg stegokey\n"
        "\tsvgstego capacity path/to/cover.svg\n"
        "\tsvgstego distortion path/to/cover.svg path/to/stego-object.svg\n";

    static int fail(StegoError err, const std::string& subject)
    {
        std::cerr << "Error: ";
        if (!subject.empty()) {
            std::cerr << subject << ": ";
        }
        std::cerr << errorMessage(err) << "\n";
        if (err == StegoError::UsageError) {
            std::cerr << USAGE_TIP;
        }
        return exitCodeFor(err);
    }

    static bool readFile(const std::string& path, std::vector<uint8_t>& outBytes)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return false;
        }
        outBytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return !in.bad();
    }

    // 写 stdout 失败（管道断了、磁盘满）
    static int outputFailed(const char* tag)
    {
        std::cerr << "[" << tag << "] Failed to write result to output stream\n";
        return exitCodeFor(StegoError::InvalidFile);
    }

    static int doEmbed(const std::vector<std::string>& args, std::ostream& out)
    {
        if (args.size() != 3) {
            return fail(StegoError::UsageError, "");
        }
        const std::string& msgPath = args[0];
        const std::string& coverPath = args[1];
        const std::string& stegoKey = args[2];

        std::vector<uint8_t> msg;
        if (!readFile(msgPath, msg)) {
            return fail(StegoError::InvalidFile, msgPath);
        }

        StegoError err = StegoError::None;
        SvgDocument svg;
        if (!svg.loadFile(coverPath, err)) {
            return fail(err, coverPath);
        }

        if (!embedMessage(svg, stegoKey, msg, err)) {
            return fail(err, coverPath);
        }

        std::string xml;
        if (!svg.serialize(xml)) {
            return fail(StegoError::InvalidDocument, coverPath);
        }

        out << xml;
        out.flush();
        return out ? 0 : outputFailed("embed");
    }

    static int doExtract(const std::vector<std::string>& args, std::ostream& out)
    {
        if (args.size() != 2) {
            return fail(StegoError::UsageError, "");
        }
        const std::string& stegoPath = args[0];
        const std::string& stegoKey = args[1];

        StegoError err = StegoError::None;
        SvgDocument svg;
        if (!svg.loadFile(stegoPath, err)) {
            return fail(err, stegoPath);
        }

        std::vector<uint8_t> msg;
        if (!extractMessage(svg, stegoKey, msg, err)) {
            return fail(err, stegoPath);
        }

        // payload 原样输出，不加换行
        out.write(reinterpret_cast<const char*>(msg.data()),
                  static_cast<std::streamsize>(msg.size()));
        out.flush();
        return out ? 0 : outputFailed("extract");
    }

    static int doCapacity(const std::vector<std::string>& args, std::ostream& out)
    {
        if (args.size() != 1) {
            return fail(StegoError::UsageError, "");
        }
        const std::string& coverPath = args[0];

        StegoError err = StegoError::None;
        SvgDocument svg;
        if (!svg.loadFile(coverPath, err)) {
            return fail(err, coverPath);
        }

        CapacityReport report = capacity(svg);
        if (report.bytes < 0) {
            // header 都放不下
            out << "Embedding capacity: none (" << report.slotCount
                << " slots, " << report.headerBits
                << " needed for the length header; capacity " << report.bytes << ").\n";
        } else {
            out << "Embedding capacity: " << report.bytes << " ASCII characters.\n"
                << "Embedding slots: " << report.slotCount << "\n";
        }
        out.flush();
        return out ? 0 : outputFailed("capacity");
    }

    static int doDistortion(const std::vector<std::string>& args, std::ostream& out)
    {
        if (args.size() != 2) {
            return fail(StegoError::UsageError, "");
        }

        StegoError err = StegoError::None;
        SvgDocument cover, stego;
        if (!cover.loadFile(args[0], err)) {
            return fail(err, args[0]);
        }
        if (!stego.loadFile(args[1], err)) {
            return fail(err, args[1]);
        }

        metrics::LiteralDistortion d;
        if (!metrics::computeLiteralDistortion(cover, stego, d, err)) {
            return fail(err, args[1]);
        }

        out << "Slots:            " << d.slotCount << "\n"
            << "Changed literals: " << d.changedLiterals << "\n"
            << "Max |delta|:      " << d.maxAbsDelta << "\n"
            << "Mean |delta|:     " << d.meanAbsDelta << "\n";
        out.flush();
        return out ? 0 : outputFailed("metrics");
    }

    int runCli(const std::vector<std::string>& args, std::ostream& out)
    {
        if (args.empty()) {
            return fail(StegoError::UsageError, "");
        }

        std::string mode = args[0];
        // 兼容老写法 -embed / -extract / -capacity
        if (mode.size() > 1 && mode[0] == '-' && mode[1] != '-' && mode != "-h") {
            mode = mode.substr(1);
        }
        const std::vector<std::string> rest(args.begin() + 1, args.end());

        if (mode == "embed") {
            return doEmbed(rest, out);
        } else if (mode == "extract") {
            return doExtract(rest, out);
        } else if (mode == "capacity") {
            return doCapacity(rest, out);
        } else if (mode == "distortion") {
            return doDistortion(rest, out);
        } else if (mode == "help" || mode == "-h" || mode == "--help") {
            out << USAGE_TIP;
            return 0;
        }

        return fail(StegoError::UsageError, "unknown mode '" + args[0] + "'");
    }

}
