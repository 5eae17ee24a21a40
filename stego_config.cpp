#include "stego_config.hpp"

namespace svgstego {

    const TagAttributeMap& defaultEmbedTags()
    {
        static const TagAttributeMap tags = {
            { "linearGradient", { "x1", "y1", "x2", "y2" } },
            { "radialGradient", { "cx", "cy", "r", "gradientTransform" } },
            { "path",           { "d" } }
        };
        return tags;
    }

    const std::vector<std::string>& validDoctypes()
    {
        static const std::vector<std::string> doctypes = {
            "http://www.w3.org/Graphics/SVG/1.1/DTD/svg11.dtd",
            "http://www.w3.org/TR/2001/REC-SVG-20010904/DTD/svg10.dtd"
        };
        return doctypes;
    }

}
