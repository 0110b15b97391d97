// common_types.h
#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H
//定义了整个程序共享的基础数据类型、常量以及一些通用的辅助函数。
#include <string>
#include <vector>
#include <set>
#include <map>
#include <fstream>
#include <filesystem> // For path
#include <algorithm> // For std::transform
#include <cctype>    // For std::tolower

using std::string;
using std::u32string;
using std::vector;
using std::set;
using std::filesystem::path;

// --- Constants ---
const int OUTPUT_SIZE = 2048;              // Dome frames are square
const int DEFAULT_MEASURE_CANVAS_SIZE = 50;
const char32_t SPACE_CHAR = U' ';
const char32_t METRIC_REFERENCE_CHAR = U'W';
const int OUTPUT_CHANNELS = 3; // Output PNG as RGB

const set<string> SUPPORTED_EXTENSIONS = {
    ".png", ".jpg", ".jpeg", ".bmp", ".tga", ".gif"
};

// --- Structures ---

// Single channel 8-bit raster, row-major.
struct GrayImage {
    int width = 0;
    int height = 0;
    vector<unsigned char> pixels;

    GrayImage() = default;
    GrayImage(int w, int h, unsigned char fill = 0)
        : width(w), height(h), pixels(static_cast<size_t>(w) * static_cast<size_t>(h), fill) {}

    bool empty() const { return width <= 0 || height <= 0; }
    unsigned char at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
    unsigned char& at(int x, int y) { return pixels[static_cast<size_t>(y) * width + x]; }

    double mean() const {
        if (pixels.empty()) return 0.0;
        double sum = 0.0;
        for (unsigned char p : pixels) sum += p;
        return sum / static_cast<double>(pixels.size());
    }
};

// Pixel size of one character cell.
struct FontMetric {
    int width = 0;
    int height = 0;
    bool valid() const { return width > 0 && height > 0; }
};

struct GridSize {
    int cols = 0;
    int rows = 0;
};

// One row per u32string. Every row must have the same length.
using CharacterGrid = vector<u32string>;

struct FontSpec {
    string path;
    int faceIndex = 0;
};

struct Config {
    int outputSize = OUTPUT_SIZE;
    string fontName = "menlo";
    float fontSize = 10.0f;        // Font size used to render output frames
    float sortFontSize = 30.0f;    // Font size used to measure glyph brightness
    int measureCanvasSize = DEFAULT_MEASURE_CANVAS_SIZE;
    string outputDirectory = "ascii_frames/png";
    string framePrefix = "frame_";
    int frameIndexWidth = 6;
    int fps = 30;
    int previewFrameLimit = 30;
    bool preview = false;
    int workerCount = 0;           // 0 = hardware concurrency
    bool asciiOnlyCandidates = true;

    string finalFontPath = "";     // Resolved absolute/relative path used
    int finalFontFaceIndex = 0;

    // Recognized font aliases, keyed by lowercase name.
    std::map<string, FontSpec> fontAliases = {
        {"menlo", {"fonts/Menlo.ttc", 0}},
        {"monaco", {"fonts/Monaco.ttf", 0}},
        {"courier", {"/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf", 0}},
        {"dejavu", {"/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf", 0}},
    };
};

// --- Helper Functions ---

inline string toLower(string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

// Integer division rounding toward negative infinity; offsets may be negative.
inline int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

inline bool isImageFile(const path& p) {
    if (!p.has_extension()) return false;
    return SUPPORTED_EXTENSIONS.count(toLower(p.extension().string())) > 0;
}

// Helper to read a file into a byte vector. Returns an empty vector on failure.
inline vector<unsigned char> readFileBytes(const string& filename) {
    std::ifstream file(filename, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }
    std::streamsize size = file.tellg();
    if (size <= 0) {
        return {};
    }
    file.seekg(0, std::ios::beg);
    vector<unsigned char> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return {};
    }
    return buffer;
}

#endif // COMMON_TYPES_H
