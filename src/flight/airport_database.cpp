///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file airport_database.cpp
 * @brief Static airport table and nearest-airport search
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/airport_database.h"
#include "flight/geo.h"
#include "flight/identifiers.h"

#include <iterator>
#include <limits>

namespace FlightBridge {

namespace {

struct AirportEntry {
    const char* icao;
    double latitude;
    double longitude;
};

const AirportEntry AIRPORTS[] = {
    {"EDDF", 50.0379, 8.5622},
    {"EDDM", 48.3538, 11.7861},
    {"EDDB", 52.3667, 13.5033},
    {"EDDL", 51.2895, 6.7668},
    {"EDDH", 53.6304, 9.9882},
    {"EDDK", 50.8659, 7.1427},
    {"EDDS", 48.6899, 9.2220},
    {"EDDW", 53.0475, 8.7867},
    {"EDDN", 49.4987, 11.0669},
    {"EDDV", 52.4611, 9.6850},
    {"EGLL", 51.4700, -0.4543},
    {"EHAM", 52.3086, 4.7639},
    {"LFPG", 49.0097, 2.5479},
    {"LEMD", 40.4719, -3.5626},
    {"LIRF", 41.8003, 12.2389},
    {"LSZH", 47.4647, 8.5492},
    {"LOWW", 48.1103, 16.5697},
    {"EBBR", 50.9014, 4.4844},
    {"EKCH", 55.6180, 12.6560},
    {"ENGM", 60.1939, 11.1004},
    {"ESSA", 59.6519, 17.9186},
    {"EFHK", 60.3172, 24.9633},
    {"LPPT", 38.7813, -9.1359},
    {"LEBL", 41.2971, 2.0785},
    {"EIDW", 53.4213, -6.2701},
    {"EGKK", 51.1481, -0.1903},
    {"EGCC", 53.3537, -2.2750},
    {"LFPO", 48.7253, 2.3594},
    {"LIMC", 45.6306, 8.7231},
    {"LGAV", 37.9364, 23.9445},
    {"LTFM", 41.2608, 28.7419},
    {"LFSB", 47.5896, 7.5299},
    {"LSZB", 46.9141, 7.4971},
    {"LSGG", 46.2381, 6.1089},
    {"LFST", 48.5383, 7.6281},
    {"LFML", 43.4393, 5.2214},
    {"LFLL", 45.7256, 5.0811},
    {"LFMN", 43.6584, 7.2159},
    {"LFBD", 44.8283, -0.7156},
    {"LFRS", 47.1532, -1.6107},
    {"EDNY", 47.6713, 9.5115},
    {"EDSB", 48.7794, 8.0805},
    {"KJFK", 40.6413, -73.7781},
    {"KLAX", 33.9416, -118.4085},
    {"KORD", 41.9742, -87.9073},
    {"KATL", 33.6407, -84.4277},
    {"KDFW", 32.8998, -97.0403},
    {"KDEN", 39.8561, -104.6737},
    {"KSFO", 37.6213, -122.3790},
    {"KLAS", 36.0840, -115.1537},
    {"KMIA", 25.7959, -80.2870},
    {"KSEA", 47.4502, -122.3088},
    {"KBOS", 42.3656, -71.0096},
    {"KEWR", 40.6895, -74.1745},
    {"KPHX", 33.4373, -112.0078},
    {"KMSP", 44.8848, -93.2223},
    {"KDTW", 42.2162, -83.3554},
    {"KIAH", 29.9902, -95.3368},
    {"KPIT", 40.4915, -80.2329},
    {"KCLT", 35.2140, -80.9431},
    {"KMCO", 28.4312, -81.3081},
    {"KFLL", 26.0726, -80.1527},
    {"KSAN", 32.7336, -117.1897},
    {"KPDX", 45.5898, -122.5951},
    {"KSLC", 40.7884, -111.9778},
    {"KDCA", 38.8521, -77.0377},
    {"KIAD", 38.9531, -77.4565},
    {"KBWI", 39.1754, -76.6683},
    {"KTPA", 27.9755, -82.5332},
    {"KCLE", 41.4117, -81.8498},
    {"KCMH", 39.9980, -82.8919},
    {"KIND", 39.7173, -86.2944},
    {"KMKE", 42.9472, -87.8966},
    {"KSTL", 38.7487, -90.3700},
    {"KMCI", 39.2976, -94.7139},
    {"KOMA", 41.3032, -95.8941},
    {"KAUS", 30.1945, -97.6699},
    {"KSAT", 29.5337, -98.4698},
    {"KRDU", 35.8776, -78.7875},
    {"KBNA", 36.1263, -86.6774},
    {"KPHL", 39.8744, -75.2424},
    {"CYYZ", 43.6777, -79.6248},
    {"CYVR", 49.1947, -123.1840},
    {"CYUL", 45.4706, -73.7408},
    {"CYQB", 46.7911, -71.3933},
    {"RJTT", 35.5494, 139.7798},
    {"VHHH", 22.3080, 113.9185},
    {"WSSS", 1.3644, 103.9915},
    {"RKSI", 37.4691, 126.4505},
    {"ZBAA", 40.0799, 116.6031},
    {"ZSPD", 31.1443, 121.8083},
    {"OMDB", 25.2528, 55.3644},
    {"VABB", 19.0896, 72.8656},
    {"VIDP", 28.5562, 77.1000},
    {"VTBS", 13.6900, 100.7501},
    {"YSSY", -33.9399, 151.1753},
    {"YMML", -37.6690, 144.8410},
    {"NZAA", -37.0082, 174.7850},
    {"SBGR", -23.4356, -46.4731},
    {"SCEL", -33.3930, -70.7858},
    {"SAEZ", -34.8222, -58.5358},
    {"FAOR", -26.1392, 28.2460},
    {"HECA", 30.1219, 31.4056},
    {"GMMN", 33.3675, -7.5900},
    {"GGOV", 11.8948, -15.6531},
    {"GOOY", 14.7397, -17.4902},
    {"GABS", 13.4699, -16.6522},
    {"GULB", 11.5886, -13.1386},
    {"GUCY", 10.3866, -9.2617},
    {"DXXX", 6.1657, 1.2546},
    {"DGAA", 5.6052, -0.1668},
    {"DBBB", 6.3573, 2.3844},
    {"DNMM", 6.5774, 3.3212},
    {"FKKD", 4.0061, 9.7194},
    {"FCBB", -4.2517, 15.2531},
    {"FZAA", -4.3858, 15.4446},
    {"HKJK", -1.3192, 36.9278},
    {"HTDA", -6.8781, 39.2026},
    {"FMEE", -20.4302, 57.6836},
    {"FMMI", -18.7969, 47.4789},
    {"FACT", -33.9649, 18.6017},
};

} // namespace

std::optional<std::string> AirportDatabase::FindNearest(const GeoPosition& position,
                                                        double max_distance_nm) const {
    const AirportEntry* nearest = nullptr;
    double nearest_distance = std::numeric_limits<double>::max();

    for (const auto& airport : AIRPORTS) {
        const double distance = HaversineDistanceNm(position, GeoPosition{airport.latitude, airport.longitude});
        if (distance < nearest_distance && distance <= max_distance_nm) {
            nearest_distance = distance;
            nearest = &airport;
        }
    }

    if (nearest == nullptr) {
        return std::nullopt;
    }
    return std::string(nearest->icao);
}

std::optional<GeoPosition> AirportDatabase::Find(const std::string& icao) const {
    const std::string key = NormalizeIdentifier(icao);
    for (const auto& airport : AIRPORTS) {
        if (key == airport.icao) {
            return GeoPosition{airport.latitude, airport.longitude};
        }
    }
    return std::nullopt;
}

size_t AirportDatabase::Size() {
    return std::size(AIRPORTS);
}

} // namespace FlightBridge
