#include "uil/image_loader.hpp"
#include "uil/base64.hpp"
#include "uil/log.hpp"

#include <opencv2/imgcodecs.hpp>

namespace uil
{

    namespace
    {
        // "data:image/png;base64,AAAA" -> "AAAA"
        std::string strip_data_uri(const std::string &s)
        {
            if (s.rfind("data:", 0) != 0)
                return s;
            const auto comma = s.find(',');
            if (comma == std::string::npos)
                return s;
            return s.substr(comma + 1);
        }
    } // namespace

    Status decode_image_bytes(const std::vector<uint8_t> &bytes, cv::Mat &out)
    {
        out.release();
        if (bytes.empty())
            return Status::DecodeError;
        try
        {
            cv::Mat buf(1, (int)bytes.size(), CV_8U, const_cast<uint8_t *>(bytes.data()));
            out = cv::imdecode(buf, cv::IMREAD_COLOR);
        }
        catch (const cv::Exception &ex)
        {
            uil::log::d(std::string("imdecode failed: ") + ex.what());
            out.release();
        }
        return out.empty() ? Status::DecodeError : Status::Ok;
    }

    Status load_image(const std::string &data, cv::Mat &out)
    {
        out.release();
        if (data.empty())
            return Status::DecodeError;

        std::vector<uint8_t> bytes;
        if (base64_decode(strip_data_uri(data), bytes) &&
            decode_image_bytes(bytes, out) == Status::Ok)
            return Status::Ok;

        // not an embedded payload: treat as a path
        try
        {
            out = cv::imread(data, cv::IMREAD_COLOR);
        }
        catch (const cv::Exception &ex)
        {
            uil::log::d(std::string("imread failed: ") + ex.what());
            out.release();
        }
        if (out.empty())
        {
            uil::log::w("Could not decode image payload or read it as a path");
            return Status::DecodeError;
        }
        return Status::Ok;
    }

} // namespace uil
