// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_BASE_FOURCCS_H_
#define AVIFMUX_MEDIA_BASE_FOURCCS_H_

#include <cstdint>
#include <string>

namespace avifmux {
namespace media {

// Box types, brands, handler types and reference types used by AVIF files.
enum FourCC : uint32_t {
  FOURCC_NULL = 0,

  FOURCC_auxC = 0x61757843,
  FOURCC_auxi = 0x61757869,
  FOURCC_auxl = 0x6175786c,
  FOURCC_auxv = 0x61757876,
  FOURCC_av01 = 0x61763031,
  FOURCC_av1C = 0x61763143,
  FOURCC_avif = 0x61766966,
  FOURCC_avis = 0x61766973,
  FOURCC_ccst = 0x63637374,
  FOURCC_colr = 0x636f6c72,
  FOURCC_dinf = 0x64696e66,
  FOURCC_dref = 0x64726566,
  FOURCC_ftyp = 0x66747970,
  FOURCC_hdlr = 0x68646c72,
  FOURCC_iinf = 0x69696e66,
  FOURCC_iloc = 0x696c6f63,
  FOURCC_infe = 0x696e6665,
  FOURCC_ipco = 0x6970636f,
  FOURCC_ipma = 0x69706d61,
  FOURCC_iprp = 0x69707270,
  FOURCC_iref = 0x69726566,
  FOURCC_ispe = 0x69737065,
  FOURCC_mdat = 0x6d646174,
  FOURCC_mdhd = 0x6d646864,
  FOURCC_mdia = 0x6d646961,
  FOURCC_meta = 0x6d657461,
  FOURCC_miaf = 0x6d696166,
  FOURCC_mif1 = 0x6d696631,
  FOURCC_minf = 0x6d696e66,
  FOURCC_moov = 0x6d6f6f76,
  FOURCC_mvhd = 0x6d766864,
  FOURCC_nclx = 0x6e636c78,
  FOURCC_pict = 0x70696374,
  FOURCC_pitm = 0x7069746d,
  FOURCC_pixi = 0x70697869,
  FOURCC_prem = 0x7072656d,
  FOURCC_stbl = 0x7374626c,
  FOURCC_stco = 0x7374636f,
  FOURCC_stsc = 0x73747363,
  FOURCC_stsd = 0x73747364,
  FOURCC_stss = 0x73747373,
  FOURCC_stsz = 0x7374737a,
  FOURCC_stts = 0x73747473,
  FOURCC_tkhd = 0x746b6864,
  FOURCC_trak = 0x7472616b,
  FOURCC_tref = 0x74726566,
  FOURCC_url = 0x75726c20,  // "url "
  FOURCC_vmhd = 0x766d6864,
};

const inline std::string FourCCToString(FourCC fourcc) {
  char buf[5];
  buf[0] = (fourcc >> 24) & 0xff;
  buf[1] = (fourcc >> 16) & 0xff;
  buf[2] = (fourcc >> 8) & 0xff;
  buf[3] = (fourcc) & 0xff;
  buf[4] = 0;
  return std::string(buf);
}

}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_BASE_FOURCCS_H_
