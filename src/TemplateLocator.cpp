// TemplateLocator.cpp
#include "template_locator.hpp"

#include <cmath>
#include <vector>

namespace PMACRO {

namespace {

// below this variance a window or template counts as flat
constexpr double FLAT_EPS = 1e-6;

// (w+1) x (h+1) summed-area tables of values and squared values
struct Integral {
    int w = 0;
    std::vector<double> sum;
    std::vector<double> sq;

    explicit Integral(const GrayImage& img) : w(img.w + 1) {
        sum.assign((size_t)(img.w + 1) * (img.h + 1), 0.0);
        sq.assign(sum.size(), 0.0);
        for(int y = 0; y < img.h; ++y){
            double rowSum = 0.0, rowSq = 0.0;
            for(int x = 0; x < img.w; ++x){
                double v = img.at(x, y);
                rowSum += v;
                rowSq += v * v;
                size_t idx = (size_t)(y + 1) * w + (x + 1);
                sum[idx] = sum[idx - w] + rowSum;
                sq[idx] = sq[idx - w] + rowSq;
            }
        }
    }

    double rect(const std::vector<double>& t, int x, int y, int rw, int rh) const {
        size_t a = (size_t)y * w + x;
        size_t b = (size_t)y * w + x + rw;
        size_t c = (size_t)(y + rh) * w + x;
        size_t d = (size_t)(y + rh) * w + x + rw;
        return t[d] - t[b] - t[c] + t[a];
    }
};

} // namespace

MatchResult locate(const GrayImage& captured, const GrayImage& templ, double threshold) {
    MatchResult result;
    const int tw = templ.w, th = templ.h;
    if(tw <= 0 || th <= 0 || tw > captured.w || th > captured.h) return result;

    const double n = (double)tw * th;

    // zero-mean template
    double tMean = 0.0;
    for(float v : templ.data) tMean += v;
    tMean /= n;
    std::vector<float> tz(templ.data.size());
    double tVar = 0.0;
    for(size_t i = 0; i < tz.size(); ++i){
        tz[i] = (float)(templ.data[i] - tMean);
        tVar += (double)tz[i] * tz[i];
    }
    const bool tFlat = tVar < FLAT_EPS * n;

    Integral integral(captured);

    double best = -2.0;
    int bestX = 0, bestY = 0;
    for(int y = 0; y + th <= captured.h; ++y){
        for(int x = 0; x + tw <= captured.w; ++x){
            double s = integral.rect(integral.sum, x, y, tw, th);
            double ss = integral.rect(integral.sq, x, y, tw, th);
            double wVar = ss - s * s / n;
            bool wFlat = wVar < FLAT_EPS * n;

            double score;
            if(tFlat || wFlat){
                score = (tFlat && wFlat && std::fabs(s / n - tMean) < 0.5) ? 1.0 : 0.0;
            } else {
                // sum(tz) == 0, so correlating with the raw window is enough
                double num = 0.0;
                for(int j = 0; j < th; ++j){
                    const float* row = &captured.data[(size_t)(y + j) * captured.w + x];
                    const float* trow = &tz[(size_t)j * tw];
                    float acc = 0.0f;
                    for(int i = 0; i < tw; ++i) acc += trow[i] * row[i];
                    num += acc;
                }
                score = num / std::sqrt(tVar * wVar);
                if(score > 1.0) score = 1.0;
                if(score < -1.0) score = -1.0;
            }

            if(score > best){
                best = score;
                bestX = x;
                bestY = y;
            }
        }
    }

    result.searched = true;
    result.confidence = best;
    result.offset = { bestX, bestY };
    result.center = { bestX + tw / 2, bestY + th / 2 };
    result.found = best >= threshold;
    return result;
}

MatchResult locate(const Image& captured, const Image& templ, double threshold) {
    return locate(toGray(captured), toGray(templ), threshold);
}

Position rescaleToLogical(const Position& center, ScreenSize captureSize, ScreenSize logicalSize) {
    if(captureSize.width <= 0 || captureSize.height <= 0 ||
       logicalSize.width <= 0 || logicalSize.height <= 0){
        return center;
    }
    double sx = (double)captureSize.width / logicalSize.width;
    double sy = (double)captureSize.height / logicalSize.height;
    Position p;
    p.x = (int64_t)(center.x / sx);
    p.y = (int64_t)(center.y / sy);
    return p;
}

} // namespace PMACRO
