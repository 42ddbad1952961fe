#pragma once
#include <string>

namespace uil
{
    enum class Status
    {
        Ok = 0,
        DecodeError,     // payload is neither a decodable image nor a readable path
        InvalidParameter // e.g. scaled template empty or larger than the screenshot
    };

    inline const char *status_name(Status s)
    {
        switch (s)
        {
        case Status::Ok:
            return "ok";
        case Status::DecodeError:
            return "decode_error";
        case Status::InvalidParameter:
            return "invalid_parameter";
        }
        return "unknown";
    }

    struct MatchCandidate
    {
        int x = 0, y = 0;
        int width = 0, height = 0;
        int center_x = 0, center_y = 0;
        double confidence = 0.0; // 0..1, higher is better for every method
        double scale = 1.0;      // template scale factor that produced this hit
    };

    struct UIElement
    {
        int x = 0, y = 0;
        int width = 0, height = 0;
        int center_x = 0, center_y = 0;
        int area = 0;
        std::string type; // rectangle | circle | polygon | unknown | color_button_<hue>
        double confidence = 0.0;
        int vertices = 0;
    };

    // Fills derived fields (center, area) from x/y/width/height.
    template <typename Box>
    inline void finalize_box(Box &b, int x, int y, int w, int h)
    {
        b.x = x;
        b.y = y;
        b.width = w;
        b.height = h;
        b.center_x = x + w / 2;
        b.center_y = y + h / 2;
    }

    inline UIElement make_element(int x, int y, int w, int h,
                                  const std::string &type, double confidence, int vertices)
    {
        UIElement e;
        finalize_box(e, x, y, w, h);
        e.area = w * h;
        e.type = type;
        e.confidence = confidence;
        e.vertices = vertices;
        return e;
    }

    // Per-call detection options. max_area <= 0 means "half of the image".
    struct DetectOptions
    {
        int min_area = 400;
        int max_area = 0;
    };

    // Resolved once at call entry from the image size.
    inline long long resolve_max_area(const DetectOptions &opt, int imgW, int imgH)
    {
        if (opt.max_area > 0)
            return opt.max_area;
        return (long long)imgW * (long long)imgH / 2;
    }
}
