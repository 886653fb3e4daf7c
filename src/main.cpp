#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <vector>
#include <algorithm>
#include <string>
#include <argagg.hpp>
#include <slidify.hpp>

using argagg::parser_results;
using argagg::parser;
using namespace std;
using namespace slidify;

int main(int argc, char **argv) {
    parser argparser {{
            {"help", {"-h", "--help"},
                "Print help and exit",
                0},
            {"version", {"-v", "--version"},
                "Print version and exit",
                0},
            {"ofmt", {"-o", "--format"},
                "Output format. Supported: sexp (primitive listing, default), svg (preview)",
                1},
            {"precision", {"-p", "--precision"},
                "Number of significant digits for fractional values such as percent coordinates and opacities",
                1},
            {"slide_width", {"-W", "--slide-width"},
                "Slide width in inches. Default: 20 (16:9 layout)",
                1},
            {"slide_height", {"-H", "--slide-height"},
                "Slide height in inches. Default: 11.25 (16:9 layout)",
                1},
            {"sizing", {"-m", "--sizing"},
                "Sizing mode. fit: scale everything onto the slide (default). percent: express positions outside the "
                "page as percentages of the slide.",
                1},
            {"presentation", {"--presentation"},
                "Presentation mode: also skip elements carrying the hide-on-presentation class",
                0},
            {"exclude_class", {"-e", "--exclude-class"},
                "Comma-separated list of additional classes whose elements are not exported",
                1},
            {"no_header", {"--no-header"},
                "Do not export output format header/footer, only export the primitives themselves",
                0},
    }};

    ostringstream usage;
    usage
        << argv[0] << " " << lib_version << endl
        << endl
        << "Usage: " << argv[0] << " [options]... [input_file] [output_file]" << endl
        << "       " << argv[0] << " [options]... input_file... output_file" << endl
        << endl
        << "Each input file becomes one slide, in the order given. With more than two file arguments the last one "
        << "is the output file." << endl
        << "Specify \"-\" for stdin/stdout." << endl
        << endl;

    argagg::parser_results args;
    try {
        args = argparser.parse(argc, argv);
    } catch (const std::exception &e) {
        cerr << "Error: " << e.what() << endl;
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_FAILURE;
    }

    if (args["help"]) {
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_SUCCESS;
    }

    if (args["version"]) {
        cerr << lib_version << endl;
        return EXIT_SUCCESS;
    }

    vector<string> in_f_names;
    string out_f_name;
    ostream *out_f = &cout;
    ofstream out_f_file;

    if (args.pos.size() == 1) {
        in_f_names.push_back(args.pos[0]);

    } else if (args.pos.size() >= 2) {
        in_f_names.assign(args.pos.begin(), args.pos.end() - 1);
        out_f_name = args.pos.back();
    }

    if (in_f_names.empty())
        in_f_names.push_back("-");

    if (count(in_f_names.begin(), in_f_names.end(), string("-")) > 1) {
        cerr << "Error: stdin can only be read once" << endl;
        return EXIT_FAILURE;
    }

    if (!out_f_name.empty() && out_f_name != "-") {
        out_f_file.open(out_f_name);
        if (!out_f_file) {
            cerr << "Cannot open output file \"" << out_f_name << "\"" << endl;
            return EXIT_FAILURE;
        }
        out_f = &out_f_file;
    }

    bool only_shapes = args["no_header"];

    RenderSettings rset;
    int precision = 6;
    try {
        precision = args["precision"].as<int>(6);
        rset.slide_width_in = args["slide_width"].as<double>(rset.slide_width_in);
        rset.slide_height_in = args["slide_height"].as<double>(rset.slide_height_in);
    } catch (const std::exception &e) {
        cerr << "Error: Invalid numeric argument: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (precision < 1) {
        cerr << "Error: --precision must be at least 1" << endl;
        return EXIT_FAILURE;
    }

    if (!(rset.slide_width_in > 0.0 && rset.slide_height_in > 0.0)) {
        cerr << "Error: Slide width and height must be positive" << endl;
        return EXIT_FAILURE;
    }

    string sizing = args["sizing"] ? args["sizing"].as<string>() : "fit";
    transform(sizing.begin(), sizing.end(), sizing.begin(), [](unsigned char c){ return std::tolower(c); });
    if (sizing == "fit") {
        rset.sizing = SIZING_FIT;
    } else if (sizing == "percent" || sizing == "viewport-percent") {
        rset.sizing = SIZING_VIEWPORT_PERCENT;
    } else {
        cerr << "Error: Unknown sizing mode \"" << sizing << "\"" << endl;
        return EXIT_FAILURE;
    }

    string fmt = args["ofmt"] ? args["ofmt"].as<string>() : "sexp";
    transform(fmt.begin(), fmt.end(), fmt.begin(), [](unsigned char c){ return std::tolower(c); });

    ShapeSink *sink = nullptr;
    if (fmt == "svg") {
        sink = new SimpleSVGOutput(*out_f, only_shapes, precision);

    } else if (fmt == "sexp" || fmt == "s-exp" || fmt == "list") {
        sink = new SexpSlideOutput(*out_f, only_shapes, precision);

    } else {
        cerr << "Error: Unknown output format \"" << fmt << "\"" << endl;
        return EXIT_FAILURE;
    }

    ElementSelector sel;
    sel.presentation_mode = args["presentation"];
    if (args["exclude_class"]) {
        stringstream ss(args["exclude_class"].as<string>());
        string cls;
        while (getline(ss, cls, ',')) {
            if (!cls.empty())
                sel.exclude_classes.push_back(cls);
        }
    }

    SlideDeck deck;
    for (const auto &in_f_name : in_f_names) {
        bool ok = (in_f_name == "-") ? deck.add(cin) : deck.add(in_f_name);
        if (!ok) {
            cerr <<  "Error loading input file \"" << in_f_name << "\", exiting." << endl;
            delete sink;
            return EXIT_FAILURE;
        }
    }

    CairoColorSampler sampler;
    deck.render(rset, sampler, *sink, sel);

    delete sink;
    return EXIT_SUCCESS;
}
