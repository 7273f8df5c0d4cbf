#include <reel/productivity/data.h>

namespace reel::productivity {

const std::vector<std::string>& weekdayNames() {
    static const std::vector<std::string> names = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
    };
    return names;
}

std::string weekdayName(int index) {
    const auto& names = weekdayNames();
    if (index < 0 || index >= static_cast<int>(names.size())) {
        return names.front();
    }
    return names[index];
}

std::vector<std::string> hourValues() {
    std::vector<std::string> values;
    values.reserve(24);
    for (int h = 0; h < 24; ++h) {
        values.push_back(std::to_string(h));
    }
    return values;
}

const std::vector<float>& mockProductivityData() {
    static const std::vector<float> data = {
        0, 0, 0, 0, 0, 5, 15, 25, 45, 65, 70, 60,
        50, 55, 45, 35, 25, 15, 10, 5, 0, 0, 0, 0
    };
    return data;
}

int mostProductiveHour(const std::vector<float>& perHour) {
    int best = 0;
    float bestValue = 0.0f;
    for (size_t h = 0; h < perHour.size(); ++h) {
        if (perHour[h] > bestValue) {
            bestValue = perHour[h];
            best = static_cast<int>(h);
        }
    }
    return best;
}

} // namespace reel::productivity
