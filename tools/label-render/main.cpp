// label-render: rasterize a persisted label to PNG
//
// Loads a label document, binds a key/value context from --set, optionally
// rescales it, renders with the FreeType backend and writes the pixels out.

#include <labelkit/config.h>
#include <labelkit/context.h>
#include <labelkit/freetype-backend.h>
#include <labelkit/image-codec.h>
#include <labelkit/label-builder.h>
#include <labelkit/label-document.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>

#include <args.hxx>
#include <iostream>
#include <string>
#include <vector>

using namespace labelkit;

static bool parseSize(const std::string& text, float& width, float& height) {
    auto sep = text.find('x');
    if (sep == std::string::npos) return false;
    try {
        width = std::stof(text.substr(0, sep));
        height = std::stof(text.substr(sep + 1));
    } catch (const std::exception&) {
        return false;
    }
    return width > 0 && height > 0;
}

static int fail(const std::string& what, const Error& error) {
    std::cerr << "Error: " << what << ": " << error.to_string() << "\n";
    return 1;
}

int main(int argc, char** argv) {
    args::ArgumentParser parser("label-render - Render a label document to PNG");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> outFlag(parser, "PNG", "Output PNG file", {'o', "output"});
    args::ValueFlagList<std::string> setFlags(parser, "KEY=VALUE",
                                              "Context field for conditional elements",
                                              {"set"});
    args::ValueFlag<std::string> fitFlag(parser, "WxH", "Scale uniformly to fit WxH", {"fit"});
    args::Flag centerFlag(parser, "center", "Center content vertically", {"center"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "Config file", {'c', "config"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Positional<std::string> inputFile(parser, "input", "Label document (YAML)");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (!inputFile) {
        std::cerr << "Error: no input file specified\n";
        return 1;
    }
    if (!outFlag) {
        std::cerr << "Error: no output file specified (-o)\n";
        return 1;
    }

    auto configRes = Config::create(configFlag ? args::get(configFlag) : std::string());
    if (!configRes) {
        return fail("config", configRes.error());
    }
    auto config = *configRes;

    auto level = spdlog::level::from_str(
        config->get<std::string>(Config::KEY_LOG_LEVEL, "info"));
    spdlog::set_level(verboseFlag ? spdlog::level::debug : level);

    auto background = parseColor(
        config->get<std::string>(Config::KEY_RENDER_BACKGROUND, "#FFFFFFFF"));
    if (!background) {
        return fail(Config::KEY_RENDER_BACKGROUND, background.error());
    }

    Fields fields;
    for (const auto& assignment : args::get(setFlags)) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Error: --set expects KEY=VALUE, got '" << assignment << "'\n";
            return 1;
        }
        fields[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }

    float fitWidth = 0;
    float fitHeight = 0;
    if (fitFlag && !parseSize(args::get(fitFlag), fitWidth, fitHeight)) {
        std::cerr << "Error: --fit expects WxH, got '" << args::get(fitFlag) << "'\n";
        return 1;
    }

    Font::Ptr defaultFont;
    std::string fontPath = config->get<std::string>(Config::KEY_FONTS_DEFAULT, "");
    if (!fontPath.empty()) {
        auto fontRes = Font::create(std::string(), fontPath);
        if (!fontRes) {
            return fail(Config::KEY_FONTS_DEFAULT, fontRes.error());
        }
        defaultFont = *fontRes;
    }

    auto backendRes = FreeTypeBackend::create(defaultFont);
    if (!backendRes) {
        return fail("backend", backendRes.error());
    }

    std::string inputPath = args::get(inputFile);
    auto labelRes = loadLabelFile(inputPath, *background);
    if (!labelRes) {
        return fail(inputPath, labelRes.error());
    }

    auto builderRes = LabelBuilder::edit(*labelRes, *backendRes);
    if (!builderRes) {
        return fail("builder", builderRes.error());
    }
    auto builder = *builderRes;
    builder->withContext(Context::of(fields));
    if (fitFlag) builder->scaleToFit(fitWidth, fitHeight);
    if (centerFlag) builder->centerVertically();

    std::string outputPath = args::get(outFlag);
    Result<void> written = Ok();
    builder->generate([&](const Pixmap& pixmap) {
        written = writePng(pixmap, outputPath);
    });

    if (!builder->ok()) {
        return fail("render", *builder->error());
    }
    if (!written) {
        return fail(outputPath, written.error());
    }

    yinfo("label-render: wrote {}", outputPath);
    return 0;
}
