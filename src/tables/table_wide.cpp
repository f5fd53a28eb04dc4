/**
 * @file table_wide.cpp
 * @brief East Asian Wide and Fullwidth intervals, one table per Unicode version.
 *
 * Generated from the Unicode Character Database (EastAsianWidth.txt classes W and F).
 * Do not edit by hand; regenerate from the UCD release files instead.
 */

#include "tables/tables.h"

#include <iterator>

namespace termwidth {
namespace tables {

namespace {

constexpr Interval wide_eastasian_4_1_0[] = {
    {0x01100, 0x01159}, {0x0115f, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312c},
    {0x03131, 0x0318e}, {0x03190, 0x031b7}, {0x031c0, 0x031cf}, {0x031f0, 0x0321e},
    {0x03220, 0x03243}, {0x03250, 0x032fe}, {0x03300, 0x04db5}, {0x04e00, 0x09fbb},
    {0x0a000, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0fa2d},
    {0x0fa30, 0x0fa6a}, {0x0fa70, 0x0fad9}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52},
    {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6},
    {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_5_0_0[] = {
    {0x01100, 0x01159}, {0x0115f, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312c},
    {0x03131, 0x0318e}, {0x03190, 0x031b7}, {0x031c0, 0x031cf}, {0x031f0, 0x0321e},
    {0x03220, 0x03243}, {0x03250, 0x032fe}, {0x03300, 0x04db5}, {0x04e00, 0x09fbb},
    {0x0a000, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0fa2d},
    {0x0fa30, 0x0fa6a}, {0x0fa70, 0x0fad9}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52},
    {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6},
    {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_5_1_0[] = {
    {0x01100, 0x01159}, {0x0115f, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d},
    {0x03131, 0x0318e}, {0x03190, 0x031b7}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e},
    {0x03220, 0x03243}, {0x03250, 0x032fe}, {0x03300, 0x04db5}, {0x04e00, 0x09fc3},
    {0x0a000, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0fa2d},
    {0x0fa30, 0x0fa6a}, {0x0fa70, 0x0fad9}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52},
    {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6},
    {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_5_2_0[] = {
    {0x01100, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3},
    {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029}, {0x03030, 0x0303e},
    {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d}, {0x03131, 0x0318e},
    {0x03190, 0x031b7}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6},
    {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19},
    {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60},
    {0x0ffe0, 0x0ffe6}, {0x1f200, 0x1f200}, {0x1f210, 0x1f231}, {0x1f240, 0x1f248},
    {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_6_0_0[] = {
    {0x01100, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3},
    {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029}, {0x03030, 0x0303e},
    {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d}, {0x03131, 0x0318e},
    {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6},
    {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19},
    {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60},
    {0x0ffe0, 0x0ffe6}, {0x1b000, 0x1b001}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23a},
    {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_6_1_0[] = {
    {0x01100, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3},
    {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029}, {0x03030, 0x0303e},
    {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d}, {0x03131, 0x0318e},
    {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6},
    {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19},
    {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60},
    {0x0ffe0, 0x0ffe6}, {0x1b000, 0x1b001}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23a},
    {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_6_2_0[] = {
    {0x01100, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3},
    {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029}, {0x03030, 0x0303e},
    {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d}, {0x03131, 0x0318e},
    {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6},
    {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19},
    {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60},
    {0x0ffe0, 0x0ffe6}, {0x1b000, 0x1b001}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23a},
    {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_6_3_0[] = {
    {0x01100, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3},
    {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029}, {0x03030, 0x0303e},
    {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d}, {0x03131, 0x0318e},
    {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6},
    {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19},
    {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60},
    {0x0ffe0, 0x0ffe6}, {0x1b000, 0x1b001}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23a},
    {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_7_0_0[] = {
    {0x01100, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3},
    {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029}, {0x03030, 0x0303e},
    {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d}, {0x03131, 0x0318e},
    {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6},
    {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19},
    {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60},
    {0x0ffe0, 0x0ffe6}, {0x1b000, 0x1b001}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23a},
    {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_8_0_0[] = {
    {0x01100, 0x0115f}, {0x02329, 0x0232a}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3},
    {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029}, {0x03030, 0x0303e},
    {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d}, {0x03131, 0x0318e},
    {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6},
    {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19},
    {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60},
    {0x0ffe0, 0x0ffe6}, {0x1b000, 0x1b001}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23a},
    {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_9_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312d},
    {0x03131, 0x0318e}, {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e},
    {0x03220, 0x03247}, {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c},
    {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff},
    {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b},
    {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6}, {0x16fe0, 0x16fe0}, {0x17000, 0x187ec},
    {0x18800, 0x18af2}, {0x1b000, 0x1b001}, {0x1f004, 0x1f004}, {0x1f0cf, 0x1f0cf},
    {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23b},
    {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x1f300, 0x1f320}, {0x1f32d, 0x1f335},
    {0x1f337, 0x1f37c}, {0x1f37e, 0x1f393}, {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3},
    {0x1f3e0, 0x1f3f0}, {0x1f3f4, 0x1f3f4}, {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e},
    {0x1f440, 0x1f440}, {0x1f442, 0x1f4fc}, {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e},
    {0x1f550, 0x1f567}, {0x1f57a, 0x1f57a}, {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4},
    {0x1f5fb, 0x1f64f}, {0x1f680, 0x1f6c5}, {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2},
    {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6f6}, {0x1f910, 0x1f91e}, {0x1f920, 0x1f927},
    {0x1f930, 0x1f930}, {0x1f933, 0x1f93e}, {0x1f940, 0x1f94b}, {0x1f950, 0x1f95e},
    {0x1f980, 0x1f991}, {0x1f9c0, 0x1f9c0}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_10_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312e},
    {0x03131, 0x0318e}, {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e},
    {0x03220, 0x03247}, {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c},
    {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff},
    {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b},
    {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6}, {0x16fe0, 0x16fe1}, {0x17000, 0x187ec},
    {0x18800, 0x18af2}, {0x1b000, 0x1b11e}, {0x1b170, 0x1b2fb}, {0x1f004, 0x1f004},
    {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a}, {0x1f200, 0x1f202},
    {0x1f210, 0x1f23b}, {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x1f260, 0x1f265},
    {0x1f300, 0x1f320}, {0x1f32d, 0x1f335}, {0x1f337, 0x1f37c}, {0x1f37e, 0x1f393},
    {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3}, {0x1f3e0, 0x1f3f0}, {0x1f3f4, 0x1f3f4},
    {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e}, {0x1f440, 0x1f440}, {0x1f442, 0x1f4fc},
    {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e}, {0x1f550, 0x1f567}, {0x1f57a, 0x1f57a},
    {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4}, {0x1f5fb, 0x1f64f}, {0x1f680, 0x1f6c5},
    {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2}, {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6f8},
    {0x1f910, 0x1f93e}, {0x1f940, 0x1f94c}, {0x1f950, 0x1f96b}, {0x1f980, 0x1f997},
    {0x1f9c0, 0x1f9c0}, {0x1f9d0, 0x1f9e6}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_11_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312f},
    {0x03131, 0x0318e}, {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e},
    {0x03220, 0x03247}, {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c},
    {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff},
    {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b},
    {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6}, {0x16fe0, 0x16fe1}, {0x17000, 0x187f1},
    {0x18800, 0x18af2}, {0x1b000, 0x1b11e}, {0x1b170, 0x1b2fb}, {0x1f004, 0x1f004},
    {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a}, {0x1f200, 0x1f202},
    {0x1f210, 0x1f23b}, {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x1f260, 0x1f265},
    {0x1f300, 0x1f320}, {0x1f32d, 0x1f335}, {0x1f337, 0x1f37c}, {0x1f37e, 0x1f393},
    {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3}, {0x1f3e0, 0x1f3f0}, {0x1f3f4, 0x1f3f4},
    {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e}, {0x1f440, 0x1f440}, {0x1f442, 0x1f4fc},
    {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e}, {0x1f550, 0x1f567}, {0x1f57a, 0x1f57a},
    {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4}, {0x1f5fb, 0x1f64f}, {0x1f680, 0x1f6c5},
    {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2}, {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6f9},
    {0x1f910, 0x1f93e}, {0x1f940, 0x1f970}, {0x1f973, 0x1f976}, {0x1f97a, 0x1f97a},
    {0x1f97c, 0x1f9a2}, {0x1f9b0, 0x1f9b9}, {0x1f9c0, 0x1f9c2}, {0x1f9d0, 0x1f9ff},
    {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_12_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312f},
    {0x03131, 0x0318e}, {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e},
    {0x03220, 0x03247}, {0x03250, 0x032fe}, {0x03300, 0x04dbf}, {0x04e00, 0x0a48c},
    {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff},
    {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b},
    {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6}, {0x16fe0, 0x16fe3}, {0x17000, 0x187f7},
    {0x18800, 0x18af2}, {0x1b000, 0x1b11e}, {0x1b150, 0x1b152}, {0x1b164, 0x1b167},
    {0x1b170, 0x1b2fb}, {0x1f004, 0x1f004}, {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e},
    {0x1f191, 0x1f19a}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23b}, {0x1f240, 0x1f248},
    {0x1f250, 0x1f251}, {0x1f260, 0x1f265}, {0x1f300, 0x1f320}, {0x1f32d, 0x1f335},
    {0x1f337, 0x1f37c}, {0x1f37e, 0x1f393}, {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3},
    {0x1f3e0, 0x1f3f0}, {0x1f3f4, 0x1f3f4}, {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e},
    {0x1f440, 0x1f440}, {0x1f442, 0x1f4fc}, {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e},
    {0x1f550, 0x1f567}, {0x1f57a, 0x1f57a}, {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4},
    {0x1f5fb, 0x1f64f}, {0x1f680, 0x1f6c5}, {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2},
    {0x1f6d5, 0x1f6d5}, {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6fa}, {0x1f7e0, 0x1f7eb},
    {0x1f90d, 0x1f971}, {0x1f973, 0x1f976}, {0x1f97a, 0x1f9a2}, {0x1f9a5, 0x1f9aa},
    {0x1f9ae, 0x1f9ca}, {0x1f9cd, 0x1f9ff}, {0x1fa70, 0x1fa73}, {0x1fa78, 0x1fa7a},
    {0x1fa80, 0x1fa82}, {0x1fa90, 0x1fa95}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_12_1_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312f},
    {0x03131, 0x0318e}, {0x03190, 0x031ba}, {0x031c0, 0x031e3}, {0x031f0, 0x0321e},
    {0x03220, 0x03247}, {0x03250, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6},
    {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19},
    {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60},
    {0x0ffe0, 0x0ffe6}, {0x16fe0, 0x16fe3}, {0x17000, 0x187f7}, {0x18800, 0x18af2},
    {0x1b000, 0x1b11e}, {0x1b150, 0x1b152}, {0x1b164, 0x1b167}, {0x1b170, 0x1b2fb},
    {0x1f004, 0x1f004}, {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a},
    {0x1f200, 0x1f202}, {0x1f210, 0x1f23b}, {0x1f240, 0x1f248}, {0x1f250, 0x1f251},
    {0x1f260, 0x1f265}, {0x1f300, 0x1f320}, {0x1f32d, 0x1f335}, {0x1f337, 0x1f37c},
    {0x1f37e, 0x1f393}, {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3}, {0x1f3e0, 0x1f3f0},
    {0x1f3f4, 0x1f3f4}, {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e}, {0x1f440, 0x1f440},
    {0x1f442, 0x1f4fc}, {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e}, {0x1f550, 0x1f567},
    {0x1f57a, 0x1f57a}, {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4}, {0x1f5fb, 0x1f64f},
    {0x1f680, 0x1f6c5}, {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2}, {0x1f6d5, 0x1f6d5},
    {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6fa}, {0x1f7e0, 0x1f7eb}, {0x1f90d, 0x1f971},
    {0x1f973, 0x1f976}, {0x1f97a, 0x1f9a2}, {0x1f9a5, 0x1f9aa}, {0x1f9ae, 0x1f9ca},
    {0x1f9cd, 0x1f9ff}, {0x1fa70, 0x1fa73}, {0x1fa78, 0x1fa7a}, {0x1fa80, 0x1fa82},
    {0x1fa90, 0x1fa95}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_13_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312f},
    {0x03131, 0x0318e}, {0x03190, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c},
    {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52},
    {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6},
    {0x16fe0, 0x16fe3}, {0x17000, 0x187f7}, {0x18800, 0x18cd5}, {0x18d00, 0x18d08},
    {0x1b000, 0x1b11e}, {0x1b150, 0x1b152}, {0x1b164, 0x1b167}, {0x1b170, 0x1b2fb},
    {0x1f004, 0x1f004}, {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a},
    {0x1f200, 0x1f202}, {0x1f210, 0x1f23b}, {0x1f240, 0x1f248}, {0x1f250, 0x1f251},
    {0x1f260, 0x1f265}, {0x1f300, 0x1f320}, {0x1f32d, 0x1f335}, {0x1f337, 0x1f37c},
    {0x1f37e, 0x1f393}, {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3}, {0x1f3e0, 0x1f3f0},
    {0x1f3f4, 0x1f3f4}, {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e}, {0x1f440, 0x1f440},
    {0x1f442, 0x1f4fc}, {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e}, {0x1f550, 0x1f567},
    {0x1f57a, 0x1f57a}, {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4}, {0x1f5fb, 0x1f64f},
    {0x1f680, 0x1f6c5}, {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2}, {0x1f6d5, 0x1f6d7},
    {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6fc}, {0x1f7e0, 0x1f7eb}, {0x1f90c, 0x1f93a},
    {0x1f93c, 0x1f945}, {0x1f947, 0x1f978}, {0x1f97a, 0x1f9cb}, {0x1f9cd, 0x1f9ff},
    {0x1fa70, 0x1fa74}, {0x1fa78, 0x1fa7a}, {0x1fa80, 0x1fa86}, {0x1fa90, 0x1faa8},
    {0x1fab0, 0x1fab6}, {0x1fac0, 0x1fac2}, {0x1fad0, 0x1fad6}, {0x20000, 0x2fffd},
    {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_14_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312f},
    {0x03131, 0x0318e}, {0x03190, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c},
    {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52},
    {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6},
    {0x16fe0, 0x16fe3}, {0x17000, 0x187f7}, {0x18800, 0x18cd5}, {0x18d00, 0x18d08},
    {0x1aff0, 0x1aff3}, {0x1aff5, 0x1affb}, {0x1affd, 0x1affe}, {0x1b000, 0x1b122},
    {0x1b150, 0x1b152}, {0x1b164, 0x1b167}, {0x1b170, 0x1b2fb}, {0x1f004, 0x1f004},
    {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a}, {0x1f200, 0x1f202},
    {0x1f210, 0x1f23b}, {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x1f260, 0x1f265},
    {0x1f300, 0x1f320}, {0x1f32d, 0x1f335}, {0x1f337, 0x1f37c}, {0x1f37e, 0x1f393},
    {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3}, {0x1f3e0, 0x1f3f0}, {0x1f3f4, 0x1f3f4},
    {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e}, {0x1f440, 0x1f440}, {0x1f442, 0x1f4fc},
    {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e}, {0x1f550, 0x1f567}, {0x1f57a, 0x1f57a},
    {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4}, {0x1f5fb, 0x1f64f}, {0x1f680, 0x1f6c5},
    {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2}, {0x1f6d5, 0x1f6d7}, {0x1f6dd, 0x1f6df},
    {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6fc}, {0x1f7e0, 0x1f7eb}, {0x1f7f0, 0x1f7f0},
    {0x1f90c, 0x1f93a}, {0x1f93c, 0x1f945}, {0x1f947, 0x1f9ff}, {0x1fa70, 0x1fa74},
    {0x1fa78, 0x1fa7c}, {0x1fa80, 0x1fa86}, {0x1fa90, 0x1faac}, {0x1fab0, 0x1faba},
    {0x1fac0, 0x1fac5}, {0x1fad0, 0x1fad9}, {0x1fae0, 0x1fae7}, {0x1faf0, 0x1faf6},
    {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_15_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x02ffb}, {0x03000, 0x03029},
    {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312f},
    {0x03131, 0x0318e}, {0x03190, 0x031e3}, {0x031f0, 0x0321e}, {0x03220, 0x03247},
    {0x03250, 0x04dbf}, {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c},
    {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52},
    {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6},
    {0x16fe0, 0x16fe3}, {0x17000, 0x187f7}, {0x18800, 0x18cd5}, {0x18d00, 0x18d08},
    {0x1aff0, 0x1aff3}, {0x1aff5, 0x1affb}, {0x1affd, 0x1affe}, {0x1b000, 0x1b122},
    {0x1b132, 0x1b132}, {0x1b150, 0x1b152}, {0x1b155, 0x1b155}, {0x1b164, 0x1b167},
    {0x1b170, 0x1b2fb}, {0x1f004, 0x1f004}, {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e},
    {0x1f191, 0x1f19a}, {0x1f200, 0x1f202}, {0x1f210, 0x1f23b}, {0x1f240, 0x1f248},
    {0x1f250, 0x1f251}, {0x1f260, 0x1f265}, {0x1f300, 0x1f320}, {0x1f32d, 0x1f335},
    {0x1f337, 0x1f37c}, {0x1f37e, 0x1f393}, {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3},
    {0x1f3e0, 0x1f3f0}, {0x1f3f4, 0x1f3f4}, {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e},
    {0x1f440, 0x1f440}, {0x1f442, 0x1f4fc}, {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e},
    {0x1f550, 0x1f567}, {0x1f57a, 0x1f57a}, {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4},
    {0x1f5fb, 0x1f64f}, {0x1f680, 0x1f6c5}, {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2},
    {0x1f6d5, 0x1f6d7}, {0x1f6dc, 0x1f6df}, {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6fc},
    {0x1f7e0, 0x1f7eb}, {0x1f7f0, 0x1f7f0}, {0x1f90c, 0x1f93a}, {0x1f93c, 0x1f945},
    {0x1f947, 0x1f9ff}, {0x1fa70, 0x1fa7c}, {0x1fa80, 0x1fa88}, {0x1fa90, 0x1fabd},
    {0x1fabf, 0x1fac5}, {0x1face, 0x1fadb}, {0x1fae0, 0x1fae8}, {0x1faf0, 0x1faf8},
    {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_15_1_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x02693, 0x02693}, {0x026a1, 0x026a1},
    {0x026aa, 0x026ab}, {0x026bd, 0x026be}, {0x026c4, 0x026c5}, {0x026ce, 0x026ce},
    {0x026d4, 0x026d4}, {0x026ea, 0x026ea}, {0x026f2, 0x026f3}, {0x026f5, 0x026f5},
    {0x026fa, 0x026fa}, {0x026fd, 0x026fd}, {0x02705, 0x02705}, {0x0270a, 0x0270b},
    {0x02728, 0x02728}, {0x0274c, 0x0274c}, {0x0274e, 0x0274e}, {0x02753, 0x02755},
    {0x02757, 0x02757}, {0x02795, 0x02797}, {0x027b0, 0x027b0}, {0x027bf, 0x027bf},
    {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50}, {0x02b55, 0x02b55}, {0x02e80, 0x02e99},
    {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5}, {0x02ff0, 0x03029}, {0x03030, 0x0303e},
    {0x03041, 0x03096}, {0x0309b, 0x030ff}, {0x03105, 0x0312f}, {0x03131, 0x0318e},
    {0x03190, 0x031e3}, {0x031ef, 0x0321e}, {0x03220, 0x03247}, {0x03250, 0x04dbf},
    {0x04e00, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c}, {0x0ac00, 0x0d7a3},
    {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52}, {0x0fe54, 0x0fe66},
    {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6}, {0x16fe0, 0x16fe3},
    {0x17000, 0x187f7}, {0x18800, 0x18cd5}, {0x18d00, 0x18d08}, {0x1aff0, 0x1aff3},
    {0x1aff5, 0x1affb}, {0x1affd, 0x1affe}, {0x1b000, 0x1b122}, {0x1b132, 0x1b132},
    {0x1b150, 0x1b152}, {0x1b155, 0x1b155}, {0x1b164, 0x1b167}, {0x1b170, 0x1b2fb},
    {0x1f004, 0x1f004}, {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a},
    {0x1f200, 0x1f202}, {0x1f210, 0x1f23b}, {0x1f240, 0x1f248}, {0x1f250, 0x1f251},
    {0x1f260, 0x1f265}, {0x1f300, 0x1f320}, {0x1f32d, 0x1f335}, {0x1f337, 0x1f37c},
    {0x1f37e, 0x1f393}, {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3}, {0x1f3e0, 0x1f3f0},
    {0x1f3f4, 0x1f3f4}, {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e}, {0x1f440, 0x1f440},
    {0x1f442, 0x1f4fc}, {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e}, {0x1f550, 0x1f567},
    {0x1f57a, 0x1f57a}, {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4}, {0x1f5fb, 0x1f64f},
    {0x1f680, 0x1f6c5}, {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2}, {0x1f6d5, 0x1f6d7},
    {0x1f6dc, 0x1f6df}, {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6fc}, {0x1f7e0, 0x1f7eb},
    {0x1f7f0, 0x1f7f0}, {0x1f90c, 0x1f93a}, {0x1f93c, 0x1f945}, {0x1f947, 0x1f9ff},
    {0x1fa70, 0x1fa7c}, {0x1fa80, 0x1fa88}, {0x1fa90, 0x1fabd}, {0x1fabf, 0x1fac5},
    {0x1face, 0x1fadb}, {0x1fae0, 0x1fae8}, {0x1faf0, 0x1faf8}, {0x20000, 0x2fffd},
    {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_16_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02630, 0x02637}, {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x0268a, 0x0268f},
    {0x02693, 0x02693}, {0x026a1, 0x026a1}, {0x026aa, 0x026ab}, {0x026bd, 0x026be},
    {0x026c4, 0x026c5}, {0x026ce, 0x026ce}, {0x026d4, 0x026d4}, {0x026ea, 0x026ea},
    {0x026f2, 0x026f3}, {0x026f5, 0x026f5}, {0x026fa, 0x026fa}, {0x026fd, 0x026fd},
    {0x02705, 0x02705}, {0x0270a, 0x0270b}, {0x02728, 0x02728}, {0x0274c, 0x0274c},
    {0x0274e, 0x0274e}, {0x02753, 0x02755}, {0x02757, 0x02757}, {0x02795, 0x02797},
    {0x027b0, 0x027b0}, {0x027bf, 0x027bf}, {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50},
    {0x02b55, 0x02b55}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5},
    {0x02ff0, 0x03029}, {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff},
    {0x03105, 0x0312f}, {0x03131, 0x0318e}, {0x03190, 0x031e5}, {0x031ef, 0x0321e},
    {0x03220, 0x03247}, {0x03250, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c},
    {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52},
    {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6},
    {0x16fe0, 0x16fe3}, {0x17000, 0x187f7}, {0x18800, 0x18cd5}, {0x18cff, 0x18d08},
    {0x1aff0, 0x1aff3}, {0x1aff5, 0x1affb}, {0x1affd, 0x1affe}, {0x1b000, 0x1b122},
    {0x1b132, 0x1b132}, {0x1b150, 0x1b152}, {0x1b155, 0x1b155}, {0x1b164, 0x1b167},
    {0x1b170, 0x1b2fb}, {0x1d300, 0x1d356}, {0x1d360, 0x1d376}, {0x1f004, 0x1f004},
    {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a}, {0x1f200, 0x1f202},
    {0x1f210, 0x1f23b}, {0x1f240, 0x1f248}, {0x1f250, 0x1f251}, {0x1f260, 0x1f265},
    {0x1f300, 0x1f320}, {0x1f32d, 0x1f335}, {0x1f337, 0x1f37c}, {0x1f37e, 0x1f393},
    {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3}, {0x1f3e0, 0x1f3f0}, {0x1f3f4, 0x1f3f4},
    {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e}, {0x1f440, 0x1f440}, {0x1f442, 0x1f4fc},
    {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e}, {0x1f550, 0x1f567}, {0x1f57a, 0x1f57a},
    {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4}, {0x1f5fb, 0x1f64f}, {0x1f680, 0x1f6c5},
    {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2}, {0x1f6d5, 0x1f6d7}, {0x1f6dc, 0x1f6df},
    {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6fc}, {0x1f7e0, 0x1f7eb}, {0x1f7f0, 0x1f7f0},
    {0x1f90c, 0x1f93a}, {0x1f93c, 0x1f945}, {0x1f947, 0x1f9ff}, {0x1fa70, 0x1fa7c},
    {0x1fa80, 0x1fa89}, {0x1fa8f, 0x1fac6}, {0x1face, 0x1fadc}, {0x1fadf, 0x1fae9},
    {0x1faf0, 0x1faf8}, {0x20000, 0x2fffd}, {0x30000, 0x3fffd},
};

constexpr Interval wide_eastasian_17_0_0[] = {
    {0x01100, 0x0115f}, {0x0231a, 0x0231b}, {0x02329, 0x0232a}, {0x023e9, 0x023ec},
    {0x023f0, 0x023f0}, {0x023f3, 0x023f3}, {0x025fd, 0x025fe}, {0x02614, 0x02615},
    {0x02630, 0x02637}, {0x02648, 0x02653}, {0x0267f, 0x0267f}, {0x0268a, 0x0268f},
    {0x02693, 0x02693}, {0x026a1, 0x026a1}, {0x026aa, 0x026ab}, {0x026bd, 0x026be},
    {0x026c4, 0x026c5}, {0x026ce, 0x026ce}, {0x026d4, 0x026d4}, {0x026ea, 0x026ea},
    {0x026f2, 0x026f3}, {0x026f5, 0x026f5}, {0x026fa, 0x026fa}, {0x026fd, 0x026fd},
    {0x02705, 0x02705}, {0x0270a, 0x0270b}, {0x02728, 0x02728}, {0x0274c, 0x0274c},
    {0x0274e, 0x0274e}, {0x02753, 0x02755}, {0x02757, 0x02757}, {0x02795, 0x02797},
    {0x027b0, 0x027b0}, {0x027bf, 0x027bf}, {0x02b1b, 0x02b1c}, {0x02b50, 0x02b50},
    {0x02b55, 0x02b55}, {0x02e80, 0x02e99}, {0x02e9b, 0x02ef3}, {0x02f00, 0x02fd5},
    {0x02ff0, 0x03029}, {0x03030, 0x0303e}, {0x03041, 0x03096}, {0x0309b, 0x030ff},
    {0x03105, 0x0312f}, {0x03131, 0x0318e}, {0x03190, 0x031e5}, {0x031ef, 0x0321e},
    {0x03220, 0x03247}, {0x03250, 0x0a48c}, {0x0a490, 0x0a4c6}, {0x0a960, 0x0a97c},
    {0x0ac00, 0x0d7a3}, {0x0f900, 0x0faff}, {0x0fe10, 0x0fe19}, {0x0fe30, 0x0fe52},
    {0x0fe54, 0x0fe66}, {0x0fe68, 0x0fe6b}, {0x0ff01, 0x0ff60}, {0x0ffe0, 0x0ffe6},
    {0x16fe0, 0x16fe3}, {0x16ff2, 0x16ff6}, {0x17000, 0x18cd5}, {0x18cff, 0x18d1e},
    {0x18d80, 0x18df2}, {0x1aff0, 0x1aff3}, {0x1aff5, 0x1affb}, {0x1affd, 0x1affe},
    {0x1b000, 0x1b122}, {0x1b132, 0x1b132}, {0x1b150, 0x1b152}, {0x1b155, 0x1b155},
    {0x1b164, 0x1b167}, {0x1b170, 0x1b2fb}, {0x1d300, 0x1d356}, {0x1d360, 0x1d376},
    {0x1f004, 0x1f004}, {0x1f0cf, 0x1f0cf}, {0x1f18e, 0x1f18e}, {0x1f191, 0x1f19a},
    {0x1f200, 0x1f202}, {0x1f210, 0x1f23b}, {0x1f240, 0x1f248}, {0x1f250, 0x1f251},
    {0x1f260, 0x1f265}, {0x1f300, 0x1f320}, {0x1f32d, 0x1f335}, {0x1f337, 0x1f37c},
    {0x1f37e, 0x1f393}, {0x1f3a0, 0x1f3ca}, {0x1f3cf, 0x1f3d3}, {0x1f3e0, 0x1f3f0},
    {0x1f3f4, 0x1f3f4}, {0x1f3f8, 0x1f3fa}, {0x1f400, 0x1f43e}, {0x1f440, 0x1f440},
    {0x1f442, 0x1f4fc}, {0x1f4ff, 0x1f53d}, {0x1f54b, 0x1f54e}, {0x1f550, 0x1f567},
    {0x1f57a, 0x1f57a}, {0x1f595, 0x1f596}, {0x1f5a4, 0x1f5a4}, {0x1f5fb, 0x1f64f},
    {0x1f680, 0x1f6c5}, {0x1f6cc, 0x1f6cc}, {0x1f6d0, 0x1f6d2}, {0x1f6d5, 0x1f6d8},
    {0x1f6dc, 0x1f6df}, {0x1f6eb, 0x1f6ec}, {0x1f6f4, 0x1f6fc}, {0x1f7e0, 0x1f7eb},
    {0x1f7f0, 0x1f7f0}, {0x1f90c, 0x1f93a}, {0x1f93c, 0x1f945}, {0x1f947, 0x1f9ff},
    {0x1fa70, 0x1fa7c}, {0x1fa80, 0x1fa8a}, {0x1fa8e, 0x1fac6}, {0x1fac8, 0x1fac8},
    {0x1facd, 0x1fadc}, {0x1fadf, 0x1faea}, {0x1faef, 0x1faf8}, {0x20000, 0x2fffd},
    {0x30000, 0x3fffd},
};

} // namespace

const GeneratedTable kWideEastAsianTables[] = {
    {"4.1.0", wide_eastasian_4_1_0, std::size(wide_eastasian_4_1_0)},
    {"5.0.0", wide_eastasian_5_0_0, std::size(wide_eastasian_5_0_0)},
    {"5.1.0", wide_eastasian_5_1_0, std::size(wide_eastasian_5_1_0)},
    {"5.2.0", wide_eastasian_5_2_0, std::size(wide_eastasian_5_2_0)},
    {"6.0.0", wide_eastasian_6_0_0, std::size(wide_eastasian_6_0_0)},
    {"6.1.0", wide_eastasian_6_1_0, std::size(wide_eastasian_6_1_0)},
    {"6.2.0", wide_eastasian_6_2_0, std::size(wide_eastasian_6_2_0)},
    {"6.3.0", wide_eastasian_6_3_0, std::size(wide_eastasian_6_3_0)},
    {"7.0.0", wide_eastasian_7_0_0, std::size(wide_eastasian_7_0_0)},
    {"8.0.0", wide_eastasian_8_0_0, std::size(wide_eastasian_8_0_0)},
    {"9.0.0", wide_eastasian_9_0_0, std::size(wide_eastasian_9_0_0)},
    {"10.0.0", wide_eastasian_10_0_0, std::size(wide_eastasian_10_0_0)},
    {"11.0.0", wide_eastasian_11_0_0, std::size(wide_eastasian_11_0_0)},
    {"12.0.0", wide_eastasian_12_0_0, std::size(wide_eastasian_12_0_0)},
    {"12.1.0", wide_eastasian_12_1_0, std::size(wide_eastasian_12_1_0)},
    {"13.0.0", wide_eastasian_13_0_0, std::size(wide_eastasian_13_0_0)},
    {"14.0.0", wide_eastasian_14_0_0, std::size(wide_eastasian_14_0_0)},
    {"15.0.0", wide_eastasian_15_0_0, std::size(wide_eastasian_15_0_0)},
    {"15.1.0", wide_eastasian_15_1_0, std::size(wide_eastasian_15_1_0)},
    {"16.0.0", wide_eastasian_16_0_0, std::size(wide_eastasian_16_0_0)},
    {"17.0.0", wide_eastasian_17_0_0, std::size(wide_eastasian_17_0_0)},
};

const size_t kWideEastAsianTableCount = std::size(kWideEastAsianTables);

} // namespace tables
} // namespace termwidth
