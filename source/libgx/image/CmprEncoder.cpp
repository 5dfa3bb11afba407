/*
 * @file
 * @brief CMPR encoding. Based on WIMGT's implementation.
 */

#include "CmprEncoder.hpp"

#include <climits>
#include <cstdlib>

IMPORT_STD;

namespace libgx::image {

namespace {

// clang-format off
constexpr u8 cc58[32] = // convert 5-bit color to 8-bit color
{
	0x00,0x08,0x10,0x19, 0x21,0x29,0x31,0x3a, 0x42,0x4a,0x52,0x5a, 0x63,0x6b,0x73,0x7b,
	0x84,0x8c,0x94,0x9c, 0xa5,0xad,0xb5,0xbd, 0xc5,0xce,0xd6,0xde, 0xe6,0xef,0xf7,0xff
};

constexpr u8 cc68[64] = // convert 6-bit color to 8-bit color
{
	0x00,0x04,0x08,0x0c, 0x10,0x14,0x18,0x1c, 0x20,0x24,0x28,0x2d, 0x31,0x35,0x39,0x3d,
	0x41,0x45,0x49,0x4d, 0x51,0x55,0x59,0x5d, 0x61,0x65,0x69,0x6d, 0x71,0x75,0x79,0x7d,
	0x82,0x86,0x8a,0x8e, 0x92,0x96,0x9a,0x9e, 0xa2,0xa6,0xaa,0xae, 0xb2,0xb6,0xba,0xbe,
	0xc2,0xc6,0xca,0xce, 0xd2,0xd7,0xdb,0xdf, 0xe3,0xe7,0xeb,0xef, 0xf3,0xf7,0xfb,0xff
};
// clang-format on

// 8-bit -> 5/6-bit, round to nearest
constexpr u8 cc85(u8 v) { return static_cast<u8>((v * 31 + 127) / 255); }
constexpr u8 cc86(u8 v) { return static_cast<u8>((v * 63 + 127) / 255); }

constexpr u32 CMPR_MAX_COL = 16;

using Color = std::array<u8, 4>;

struct CmprInfo {
  u32 opaque_count = 0;
  // p[0] + p[1]: endpoints
  // if opaque_count < 16: p[2] == p[3]
  std::array<Color, 4> p{};
};

u32 calc_distance(const u8* v1, const Color& v2) {
  const int d0 = (int)v1[0] - (int)v2[0];
  const int d1 = (int)v1[1] - (int)v2[1];
  const int d2 = (int)v1[2] - (int)v2[2];
  return std::abs(d0) + std::abs(d1) + std::abs(d2);
}

u16 pack565(const Color& c) {
  return static_cast<u16>(cc85(c[0]) << 11 | cc86(c[1]) << 5 | cc85(c[2]));
}
Color unpack565(u16 p) {
  return {cc58[p >> 11], cc68[p >> 5 & 0x3f], cc58[p & 0x1f], 0xff};
}

void write_be16(u8* dest, u16 val) {
  dest[0] = static_cast<u8>(val >> 8);
  dest[1] = static_cast<u8>(val);
}

// |data| is 16 RGBA pixels, row-major
void CMPR_close_info(const u8* data, CmprInfo& info, u8* dest) {
  Color& pal0 = info.p[0];
  Color& pal1 = info.p[1];

  if (info.opaque_count < CMPR_MAX_COL) {
    if (!info.opaque_count) {
      *dest++ = 0;
      *dest++ = 0;
      std::memset(dest, 0xff, 6);
      return;
    }

    // we have at least one transparent pixel

    u16 p0 = pack565(pal0);
    u16 p1 = pack565(pal1);
    if (p0 == p1) {
      // make p0 < p1
      p0 &= ~(u16)1;
      p1 |= 1;
    } else if (p0 > p1) {
      std::swap(p0, p1);
    }
    write_be16(dest, p0);
    dest += 2;
    write_be16(dest, p1);
    dest += 2;

    // re calculate palette colors
    pal0 = unpack565(p0);
    pal1 = unpack565(p1);

    Color& pal2 = info.p[2];
    pal2[0] = (pal0[0] + pal1[0]) / 2;
    pal2[1] = (pal0[1] + pal1[1]) / 2;
    pal2[2] = (pal0[2] + pal1[2]) / 2;
    pal2[3] = 0xff;
    info.p[3] = pal2;

    for (u32 i = 0; i < 4; i++) {
      u8 val = 0;
      for (u32 j = 0; j < 4; j++, data += 4) {
        val <<= 2;
        if (data[3] & 0x80) {
          const u32 d0 = calc_distance(data, pal0);
          const u32 d1 = calc_distance(data, pal1);
          const u32 d2 = calc_distance(data, pal2);
          if (d1 <= d2)
            val |= d1 <= d0;
          else if (d2 < d0)
            val |= 2;
        } else {
          val |= 3;
        }
      }
      *dest++ = val;
    }
    return;
  }

  // we haven't any transparent pixel

  u16 p0 = pack565(pal0);
  u16 p1 = pack565(pal1);
  if (p0 == p1) {
    // make p0 > p1
    p0 |= 1;
    p1 &= ~(u16)1;
  } else if (p0 < p1) {
    std::swap(p0, p1);
  }
  write_be16(dest, p0);
  dest += 2;
  write_be16(dest, p1);
  dest += 2;

  pal0 = unpack565(p0);
  pal1 = unpack565(p1);

  Color& pal2 = info.p[2];
  pal2[0] = (2 * pal0[0] + pal1[0]) / 3;
  pal2[1] = (2 * pal0[1] + pal1[1]) / 3;
  pal2[2] = (2 * pal0[2] + pal1[2]) / 3;
  pal2[3] = 0xff;

  Color& pal3 = info.p[3];
  pal3[0] = (pal0[0] + 2 * pal1[0]) / 3;
  pal3[1] = (pal0[1] + 2 * pal1[1]) / 3;
  pal3[2] = (pal0[2] + 2 * pal1[2]) / 3;
  pal3[3] = 0xff;

  for (u32 i = 0; i < 4; i++) {
    u8 val = 0;
    for (u32 j = 0; j < 4; j++, data += 4) {
      val <<= 2;
      const u32 d0 = calc_distance(data, pal0);
      const u32 d1 = calc_distance(data, pal1);
      const u32 d2 = calc_distance(data, pal2);
      const u32 d3 = calc_distance(data, pal3);
      if (d0 <= d1) {
        if (d2 <= d3)
          val |= d0 <= d2 ? 0 : 2;
        else
          val |= d0 <= d3 ? 0 : 3;
      } else {
        if (d2 <= d3)
          val |= d1 <= d2 ? 1 : 2;
        else
          val |= d1 <= d3 ? 1 : 3;
      }
    }
    *dest++ = val;
  }
}

// Exhaustive search over the distinct (565-quantized) colors of the block for
// the endpoint pair with the smallest total error.
CmprInfo WIMGT_CMPR(const u8* data) {
  CmprInfo info;

  struct Sum {
    Color col{};
    u32 count = 0;
  };

  std::array<Sum, CMPR_MAX_COL> sum;
  u32 n_sum = 0, opaque_count = 0;

  const u8* data_end = data + 4 * CMPR_MAX_COL;
  for (const u8* dat = data; dat < data_end; dat += 4) {
    if (!(dat[3] & 0x80))
      continue;
    opaque_count++;
    const Color col{cc58[cc85(dat[0])], cc68[cc86(dat[1])], cc58[cc85(dat[2])],
                    0xff};
    auto* it = std::find_if(sum.begin(), sum.begin() + n_sum,
                            [&](const Sum& s) { return s.col == col; });
    if (it != sum.begin() + n_sum) {
      it->count++;
      continue;
    }
    sum[n_sum].col = col;
    sum[n_sum].count = 1;
    n_sum++;
  }

  info.opaque_count = opaque_count;
  if (!opaque_count)
    return info;

  if (n_sum < 3) {
    info.p[0] = sum[0].col;
    info.p[1] = sum[n_sum - 1].col;
    return info;
  }

  u32 best0 = 0, best1 = 0, max_dist = UINT_MAX;
  if (info.opaque_count < CMPR_MAX_COL) {
    // we have transparent points -> 1 middle point

    for (u32 s0 = 0; s0 < n_sum; s0++) {
      const Color& pal0 = sum[s0].col;
      for (u32 s1 = s0 + 1; s1 < n_sum; s1++) {
        const Color& pal1 = sum[s1].col;
        Color pal2{};
        pal2[0] = (pal0[0] + pal1[0]) / 2;
        pal2[1] = (pal0[1] + pal1[1]) / 2;
        pal2[2] = (pal0[2] + pal1[2]) / 2;

        u32 dist = 0;
        for (const u8* dat = data; dat < data_end && dist < max_dist;
             dat += 4) {
          if (dat[3] & 0x80) {
            const u32 d0 = calc_distance(dat, pal0);
            const u32 d1 = calc_distance(dat, pal1);
            const u32 d2 = calc_distance(dat, pal2);
            if (d0 <= d1)
              dist += d0 < d2 ? d0 : d2;
            else
              dist += d1 < d2 ? d1 : d2;
          }
        }
        if (max_dist > dist) {
          max_dist = dist;
          best0 = s0;
          best1 = s1;
        }
      }
    }
  } else {
    // no transparent points -> 2 middle point

    for (u32 s0 = 0; s0 < n_sum; s0++) {
      const Color& pal0 = sum[s0].col;
      for (u32 s1 = s0 + 1; s1 < n_sum; s1++) {
        const Color& pal1 = sum[s1].col;
        Color pal2{};
        pal2[0] = (2 * pal0[0] + pal1[0]) / 3;
        pal2[1] = (2 * pal0[1] + pal1[1]) / 3;
        pal2[2] = (2 * pal0[2] + pal1[2]) / 3;
        Color pal3{};
        pal3[0] = (pal0[0] + 2 * pal1[0]) / 3;
        pal3[1] = (pal0[1] + 2 * pal1[1]) / 3;
        pal3[2] = (pal0[2] + 2 * pal1[2]) / 3;

        u32 dist = 0;
        for (const u8* dat = data; dat < data_end && dist < max_dist;
             dat += 4) {
          const u32 d0 = calc_distance(dat, pal0);
          const u32 d1 = calc_distance(dat, pal1);
          const u32 d2 = calc_distance(dat, pal2);
          const u32 d3 = calc_distance(dat, pal3);
          if (d0 <= d1) {
            if (d2 <= d3)
              dist += d0 < d2 ? d0 : d2;
            else
              dist += d0 < d3 ? d0 : d3;
          } else {
            if (d2 <= d3)
              dist += d1 <= d2 ? d1 : d2;
            else
              dist += d1 <= d3 ? d1 : d3;
          }
        }
        if (max_dist > dist) {
          max_dist = dist;
          best0 = s0;
          best1 = s1;
        }
      }
    }
  }

  info.p[0] = sum[best0].col;
  info.p[1] = sum[best1].col;
  return info;
}

} // namespace

void EncodeDXT1(std::span<u8> dest, std::span<const u8> source, u32 width,
                u32 height) {
  if (width == 0 || height == 0)
    return;

  const u32 h_blocks = (width + 7) / 8;
  const u32 v_blocks = (height + 7) / 8;
  // Sub-block origins within an 8x8 tile
  constexpr std::array<std::pair<u32, u32>, 4> delta{
      {{0, 0}, {4, 0}, {0, 4}, {4, 4}}};

  u8* out = dest.data();
  for (u32 by = 0; by < v_blocks; ++by) {
    for (u32 bx = 0; bx < h_blocks; ++bx) {
      for (auto [dx, dy] : delta) {
        //---- first collect the data of the 16 pixel
        std::array<u8, 16 * 4> vector;
        u8* vect = vector.data();
        for (u32 y = 0; y < 4; ++y) {
          const u32 sy = std::min(by * 8 + dy + y, height - 1);
          for (u32 x = 0; x < 4; ++x) {
            const u32 sx = std::min(bx * 8 + dx + x, width - 1);
            std::memcpy(vect, &source[(sy * width + sx) * 4], 4);
            vect += 4;
          }
        }

        //--- analyze data
        auto info = WIMGT_CMPR(vector.data());
        CMPR_close_info(vector.data(), info, out);
        out += 8;
      }
    }
  }
}

void DecodeDXT1Block(std::span<u8, 64> dest, std::span<const u8, 8> block) {
  const u16 c0 = static_cast<u16>(block[0] << 8 | block[1]);
  const u16 c1 = static_cast<u16>(block[2] << 8 | block[3]);

  auto expand = [](u16 c) -> Color {
    const u8 r = c >> 11;
    const u8 g = c >> 5 & 0x3f;
    const u8 b = c & 0x1f;
    return {static_cast<u8>(r << 3 | r >> 2), static_cast<u8>(g << 2 | g >> 4),
            static_cast<u8>(b << 3 | b >> 2), 0xff};
  };

  std::array<Color, 4> pal;
  pal[0] = expand(c0);
  pal[1] = expand(c1);
  if (c0 > c1) {
    for (int i = 0; i < 3; ++i) {
      pal[2][i] = (2 * pal[0][i] + pal[1][i]) / 3;
      pal[3][i] = (pal[0][i] + 2 * pal[1][i]) / 3;
    }
    pal[2][3] = pal[3][3] = 0xff;
  } else {
    for (int i = 0; i < 3; ++i)
      pal[2][i] = (pal[0][i] + pal[1][i]) / 2;
    pal[2][3] = 0xff;
    pal[3] = {0, 0, 0, 0};
  }

  for (u32 y = 0; y < 4; ++y) {
    const u8 row = block[4 + y];
    for (u32 x = 0; x < 4; ++x) {
      const u32 index = (row >> (6 - x * 2)) & 3;
      std::memcpy(&dest[(y * 4 + x) * 4], pal[index].data(), 4);
    }
  }
}

} // namespace libgx::image
