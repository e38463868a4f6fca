#include "starsim/catalog_factory.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace starsim {
namespace catalog {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

uint64_t jsonToSeed(const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Expected a non-negative integer for 'seed', got '" + value + "'");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0' || errno == ERANGE) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Expected a non-negative integer for 'seed', got '" + value + "'");
    }
    return static_cast<uint64_t>(parsed);
}

// "[a, b, ...]" -> raw items, quotes removed
std::vector<std::string> jsonToList(const std::string& key, const std::string& value) {
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Expected a list for '" + key + "', got '" + value + "'");
    }

    std::vector<std::string> items;
    std::stringstream ss(value.substr(1, value.size() - 2));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(std::remove(item.begin(), item.end(), '"'), item.end());
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

} // anonymous namespace

// =============================================================================
// CatalogRequest
// =============================================================================

CatalogRequest CatalogRequest::fromJSON(const std::string& json_request) {
    auto values = parseFlatJSON(json_request);
    CatalogRequest request;

    auto has = [&values](const char* key) {
        return values.find(key) != values.end();
    };
    auto number = [&values](const char* key) {
        return jsonToDouble(key, values[key]);
    };

    if (has("name")) request.name = values["name"];

    // test pattern
    if (has("size")) request.test_pattern.size = number("size");
    if (has("spacing")) request.test_pattern.spacing = number("spacing");
    if (has("magnitudes")) {
        auto limits = jsonToList("magnitudes", values["magnitudes"]);
        if (limits.size() != 2) {
            throw CatalogException(ErrorCode::INVALID_PARAMS, "'magnitudes' needs two entries");
        }
        request.test_pattern.magnitude_min = jsonToDouble("magnitudes", limits[0]);
        request.test_pattern.magnitude_max = jsonToDouble("magnitudes", limits[1]);
    }
    if (has("magnitude_min")) request.test_pattern.magnitude_min = number("magnitude_min");
    if (has("magnitude_max")) request.test_pattern.magnitude_max = number("magnitude_max");
    if (has("random")) request.test_pattern.random = jsonToBool("random", values["random"]);
    if (has("nudge")) request.test_pattern.nudge = number("nudge");
    if (has("pm")) request.test_pattern.pm = number("pm");

    // cone, shared by the test pattern centre and the survey query
    if (has("ra")) {
        request.test_pattern.ra = number("ra");
        request.survey.ra = request.test_pattern.ra;
    }
    if (has("dec")) {
        request.test_pattern.dec = number("dec");
        request.survey.dec = request.test_pattern.dec;
    }
    if (has("radius")) request.survey.radius = number("radius");
    if (has("faint_limit")) request.survey.faint_limit = number("faint_limit");

    // variability
    if (has("stars_are_variable")) {
        request.stars_are_variable = jsonToBool("stars_are_variable", values["stars_are_variable"]);
    }
    if (has("magmax")) request.variability.magmax = number("magmax");
    if (has("fraction")) request.variability.fraction = number("fraction");
    if (has("fraction_extreme")) {
        request.variability.params.fraction_extreme = number("fraction_extreme");
    }
    if (has("options")) request.variability.params.options = jsonToList("options", values["options"]);

    if (has("seed")) {
        uint64_t seed = jsonToSeed(values["seed"]);
        request.test_pattern.seed = seed;
        request.variability.seed = seed;
    }

    return request;
}

// =============================================================================
// CatalogFactory
// =============================================================================

CatalogSource sourceForName(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "testpattern") return CatalogSource::TEST_PATTERN;
    if (lower == "ucac4") return CatalogSource::SURVEY_CONE;
    return CatalogSource::NAMED_TARGET;
}

CatalogFactory::CatalogFactory(const CatalogConfig& config,
                               SurveyProvider& provider,
                               SurveyCache& cache,
                               NameResolver& resolver,
                               const ColorRelations& relations,
                               const LightCurveFactory& lightcurves)
    : config_(config), provider_(provider), cache_(cache), resolver_(resolver),
      relations_(relations), lightcurves_(lightcurves), logger_(config, "CatalogFactory") {}

Catalog CatalogFactory::make(const CatalogRequest& request) const {
    if (request.name.empty()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Catalog request has no name");
    }

    Catalog catalog = [&]() {
        switch (sourceForName(request.name)) {
            case CatalogSource::TEST_PATTERN:
                return makeTestPattern(request.test_pattern, config_);

            case CatalogSource::SURVEY_CONE:
                return loadSurveyCatalog(request.survey, provider_, cache_, relations_, config_);

            case CatalogSource::NAMED_TARGET:
            default: {
                EquatorialCoordinates center = resolver_.resolve(request.name);
                SurveyQueryParams survey = request.survey;
                survey.ra = center.ra;
                survey.dec = center.dec;
                return loadSurveyCatalog(survey, provider_, cache_, relations_, config_);
            }
        }
    }();

    logger_.debug("built " + kindToString(catalog.kind()) + " catalog " + catalog.name() +
                  " for '" + request.name + "'");

    if (request.stars_are_variable) {
        catalog.addLightCurves(request.variability, lightcurves_);
    }

    return catalog;
}

} // namespace catalog
} // namespace starsim
