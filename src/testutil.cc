// This file is part of Reelstore, a deduplicating store for large media files.
// Copyright (C) 2016 Lamb <slamb@slamb.org>
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// In addition, as a special exception, the copyright holders give
// permission to link the code of portions of this program with the
// OpenSSL library under certain conditions as described in each
// individual source file, and distribute linked combinations including
// the two.
//
// You must obey the GNU General Public License in all respects for all
// of the code used other than OpenSSL. If you modify file(s) with this
// exception, you may extend this exception to your version of the
// file(s), but you are not obligated to do so. If you do not wish to do
// so, delete this exception statement from your version. If you delete
// this exception statement from all source files in the program, then
// also delete it here.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// testutil.cc: implementation of testutil.h interface.

#include "testutil.h"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <algorithm>
#include <random>

#include <glog/logging.h>

#include "filesystem.h"
#include "string.h"

namespace reelstore {

namespace {

bool DeleteChildrenRecursively(const char *dirname, std::string *error_msg) {
  bool ok = true;
  auto fn = [&dirname, &ok, error_msg](const struct dirent *ent) {
    std::string name(ent->d_name);
    std::string path = StrCat(dirname, "/", name);
    if (name == "." || name == "..") {
      return IterationControl::kContinue;
    }
    bool is_dir = (ent->d_type == DT_DIR);
    if (ent->d_type == DT_UNKNOWN) {
      struct stat buf;
      int ret = GetRealFilesystem()->Stat(path.c_str(), &buf);
      CHECK_EQ(ret, 0) << path << ": " << strerror(ret);
      is_dir = S_ISDIR(buf.st_mode);
    }
    if (is_dir) {
      ok = ok && DeleteChildrenRecursively(path.c_str(), error_msg);
      if (!ok) {
        return IterationControl::kBreak;
      }
      int ret = GetRealFilesystem()->Rmdir(path.c_str());
      if (ret != 0) {
        *error_msg = StrCat("rmdir failed on ", path, ": ", strerror(ret));
        ok = false;
        return IterationControl::kBreak;
      }
    } else {
      int ret = GetRealFilesystem()->Unlink(path.c_str());
      if (ret != 0) {
        *error_msg = StrCat("unlink failed on ", path, ": ", strerror(ret));
        ok = false;
        return IterationControl::kBreak;
      }
    }
    return IterationControl::kContinue;
  };
  if (!GetRealFilesystem()->DirForEach(dirname, fn, error_msg)) {
    return false;
  }
  return ok;
}

void AppendFullBoxHeader(uint8_t version, uint32_t flags, std::string *out) {
  AppendU32((static_cast<uint32_t>(version) << 24) | flags, out);
}

void AppendZeros(size_t n, std::string *out) { out->append(n, '\0'); }

// Writes a trak holding one sample description-less track of the given
// handler type. |chunk_offsets| is written as stco or co64.
void AppendTrak(const char *handler, uint32_t track_id,
                const std::vector<uint32_t> &sample_sizes,
                uint32_t samples_per_chunk,
                const std::vector<int64_t> &chunk_offsets,
                const TestMp4Options &options, bool video, std::string *out) {
  ScopedBox trak(out, "trak");
  {
    ScopedBox tkhd(out, "tkhd");
    AppendFullBoxHeader(0, 3, out);
    AppendZeros(8, out);  // creation_time, modification_time
    AppendU32(track_id, out);
    AppendZeros(4 + 4 + 8 + 2 + 2 + 2 + 2, out);
    for (uint32_t m : {0x00010000u, 0u, 0u, 0u, 0x00010000u, 0u, 0u, 0u,
                       0x40000000u}) {
      AppendU32(m, out);
    }
    AppendU32(video ? 1280u << 16 : 0, out);
    AppendU32(video ? 720u << 16 : 0, out);
  }
  ScopedBox mdia(out, "mdia");
  {
    ScopedBox mdhd(out, "mdhd");
    AppendFullBoxHeader(0, 0, out);
    AppendZeros(8, out);
    AppendU32(90000, out);  // timescale
    AppendU32(static_cast<uint32_t>(sample_sizes.size() * 3000), out);
    AppendU16(0x55c4, out);  // language "und"
    AppendU16(0, out);
  }
  {
    ScopedBox hdlr(out, "hdlr");
    AppendFullBoxHeader(0, 0, out);
    AppendU32(0, out);  // pre_defined
    out->append(handler, 4);
    AppendZeros(12, out);
    out->append(video ? "VideoHandler" : "SoundHandler");
    out->push_back('\0');
  }
  ScopedBox minf(out, "minf");
  if (video) {
    ScopedBox vmhd(out, "vmhd");
    AppendFullBoxHeader(0, 1, out);
    AppendZeros(8, out);
  } else {
    ScopedBox smhd(out, "smhd");
    AppendFullBoxHeader(0, 0, out);
    AppendZeros(4, out);
  }
  {
    ScopedBox dinf(out, "dinf");
    ScopedBox dref(out, "dref");
    AppendFullBoxHeader(0, 0, out);
    AppendU32(1, out);
    ScopedBox url(out, "url ");
    AppendFullBoxHeader(0, 1, out);
  }
  ScopedBox stbl(out, "stbl");
  {
    ScopedBox stsd(out, "stsd");
    AppendFullBoxHeader(0, 0, out);
    AppendU32(0, out);
  }
  {
    ScopedBox stts(out, "stts");
    AppendFullBoxHeader(0, 0, out);
    AppendU32(1, out);
    AppendU32(static_cast<uint32_t>(sample_sizes.size()), out);
    AppendU32(3000, out);
  }
  {
    // A first entry for the full chunks and, if the last chunk is short, a
    // second entry for it.
    ScopedBox stsc(out, "stsc");
    AppendFullBoxHeader(0, 0, out);
    size_t full_chunks = sample_sizes.size() / samples_per_chunk;
    uint32_t remainder = sample_sizes.size() % samples_per_chunk;
    uint32_t entries = (full_chunks > 0 ? 1 : 0) + (remainder > 0 ? 1 : 0);
    AppendU32(entries, out);
    if (full_chunks > 0) {
      AppendU32(1, out);
      AppendU32(samples_per_chunk, out);
      AppendU32(1, out);
    }
    if (remainder > 0) {
      AppendU32(static_cast<uint32_t>(full_chunks + 1), out);
      AppendU32(remainder, out);
      AppendU32(1, out);
    }
  }
  {
    ScopedBox stsz(out, "stsz");
    AppendFullBoxHeader(0, 0, out);
    bool uniform = options.uniform_stsz || !video;
    for (auto s : sample_sizes) {
      uniform = uniform && s == sample_sizes[0];
    }
    AppendU32(uniform && !sample_sizes.empty() ? sample_sizes[0] : 0, out);
    AppendU32(static_cast<uint32_t>(sample_sizes.size()), out);
    if (!uniform || sample_sizes.empty()) {
      for (auto s : sample_sizes) {
        AppendU32(s, out);
      }
    }
  }
  if (options.use_co64) {
    ScopedBox co64(out, "co64");
    AppendFullBoxHeader(0, 0, out);
    AppendU32(static_cast<uint32_t>(chunk_offsets.size()), out);
    for (auto o : chunk_offsets) {
      AppendU64(o, out);
    }
  } else {
    ScopedBox stco(out, "stco");
    AppendFullBoxHeader(0, 0, out);
    AppendU32(static_cast<uint32_t>(chunk_offsets.size()), out);
    for (auto o : chunk_offsets) {
      AppendU32(static_cast<uint32_t>(o), out);
    }
  }
  if (video && options.write_stss) {
    ScopedBox stss(out, "stss");
    AppendFullBoxHeader(0, 0, out);
    AppendU32(static_cast<uint32_t>(options.sync_samples.size()), out);
    for (auto s : options.sync_samples) {
      AppendU32(s, out);
    }
  }
}

const uint32_t kAudioSampleSize = 100;

std::string BuildMoov(const TestMp4Options &options,
                      const std::vector<int64_t> &video_chunk_offsets,
                      const std::vector<int64_t> &audio_chunk_offsets) {
  std::string out;
  ScopedBox moov(&out, "moov");
  {
    ScopedBox mvhd(&out, "mvhd");
    AppendFullBoxHeader(0, 0, &out);
    AppendZeros(8, &out);
    AppendU32(90000, &out);
    AppendU32(static_cast<uint32_t>(options.sample_sizes.size() * 3000),
              &out);
    AppendU32(0x00010000, &out);  // rate
    AppendU16(0x0100, &out);      // volume
    AppendZeros(2 + 8, &out);
    for (uint32_t m : {0x00010000u, 0u, 0u, 0u, 0x00010000u, 0u, 0u, 0u,
                       0x40000000u}) {
      AppendU32(m, &out);
    }
    AppendZeros(24, &out);
    AppendU32(3, &out);  // next_track_ID
  }
  if (options.audio_track) {
    std::vector<uint32_t> sizes(audio_chunk_offsets.size(), kAudioSampleSize);
    AppendTrak("soun", 2, sizes, 1, audio_chunk_offsets, options, false, &out);
  }
  AppendTrak("vide", 1, options.sample_sizes, options.samples_per_chunk,
             video_chunk_offsets, options, true, &out);
  return out;
}

}  // namespace

std::string PrepareTempDirOrDie(const std::string &test_name) {
  std::string dirname = StrCat("/tmp/test.", test_name);
  int ret = GetRealFilesystem()->Mkdir(dirname.c_str(), 0700);
  if (ret != 0) {
    CHECK_EQ(ret, EEXIST) << "mkdir failed: " << strerror(ret);
    std::string error_msg;
    CHECK(DeleteChildrenRecursively(dirname.c_str(), &error_msg)) << error_msg;
  }
  return dirname;
}

void WriteFileOrDie(const std::string &path, re2::StringPiece contents) {
  int ret = GetRealFilesystem()->Unlink(path.c_str());
  CHECK(ret == 0 || ret == ENOENT) << "unlink " << path << ": "
                                   << strerror(ret);
  std::unique_ptr<File> f;
  ret = GetRealFilesystem()->Open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                                  0600, &f);
  CHECK_EQ(ret, 0) << "open " << path << ": " << strerror(ret);
  ret = WriteAll(f.get(), contents);
  CHECK_EQ(ret, 0) << "write " << path << ": " << strerror(ret);
  ret = f->Close();
  CHECK_EQ(ret, 0) << "close " << path << ": " << strerror(ret);
}

std::string ReadFileOrDie(const std::string &path) {
  std::string out;
  int ret = ReadFileContents(GetRealFilesystem(), path, &out);
  CHECK_EQ(ret, 0) << "read " << path << ": " << strerror(ret);
  return out;
}

std::string RandomBytes(size_t size, uint32_t seed) {
  std::mt19937 gen(seed);
  std::string out;
  out.reserve(size + 3);
  while (out.size() < size) {
    uint32_t v = gen();
    out.append(reinterpret_cast<const char *>(&v), sizeof(v));
  }
  out.resize(size);
  return out;
}

TestMp4 MakeTestMp4(const TestMp4Options &options) {
  CHECK_GT(options.samples_per_chunk, 0u);
  const size_t num_samples = options.sample_sizes.size();
  const size_t num_chunks =
      (num_samples + options.samples_per_chunk - 1) / options.samples_per_chunk;

  std::string ftyp;
  {
    ScopedBox box(&ftyp, "ftyp");
    ftyp.append("isom");
    AppendU32(0x200, &ftyp);
    ftyp.append("isommp41");
  }
  std::string free_box;
  if (options.free_box) {
    ScopedBox box(&free_box, "free");
    free_box.append("padding!");
  }

  // The mdat payload, with offsets relative to its start.
  std::string payload;
  std::vector<int64_t> rel_samples;
  std::vector<int64_t> rel_video_chunks;
  std::vector<int64_t> rel_audio_chunks;
  for (size_t c = 0; c < num_chunks; ++c) {
    rel_video_chunks.push_back(payload.size());
    for (size_t i = c * options.samples_per_chunk;
         i < std::min(num_samples, (c + 1) * options.samples_per_chunk); ++i) {
      rel_samples.push_back(payload.size());
      payload.append(RandomBytes(options.sample_sizes[i],
                                 options.seed * 1000003 + i));
    }
    if (options.audio_track) {
      rel_audio_chunks.push_back(payload.size());
      payload.append(kAudioSampleSize, static_cast<char>(0x40 + c % 16));
    }
  }

  // moov's size doesn't depend on the offset values, so measure it first.
  std::vector<int64_t> zeros_v(rel_video_chunks.size(), 0);
  std::vector<int64_t> zeros_a(rel_audio_chunks.size(), 0);
  const size_t moov_size = BuildMoov(options, zeros_v, zeros_a).size();

  TestMp4 mp4;
  int64_t pos = ftyp.size() + free_box.size();
  if (options.moov_first) {
    mp4.moov_pos = pos;
    mp4.moov_end = pos + moov_size;
    pos = mp4.moov_end;
  }
  mp4.mdat_pos = pos;
  mp4.mdat_data_pos = pos + 8;
  mp4.mdat_end = mp4.mdat_data_pos + payload.size();
  if (!options.moov_first) {
    mp4.moov_pos = mp4.mdat_end;
    mp4.moov_end = mp4.moov_pos + moov_size;
  }

  std::vector<int64_t> video_chunks;
  for (auto o : rel_video_chunks) {
    video_chunks.push_back(mp4.mdat_data_pos + o);
  }
  std::vector<int64_t> audio_chunks;
  for (auto o : rel_audio_chunks) {
    audio_chunks.push_back(mp4.mdat_data_pos + o);
  }
  for (auto o : rel_samples) {
    mp4.sample_offsets.push_back(mp4.mdat_data_pos + o);
  }
  std::string moov = BuildMoov(options, video_chunks, audio_chunks);
  CHECK_EQ(moov_size, moov.size());

  std::string mdat;
  AppendU32(static_cast<uint32_t>(8 + payload.size()), &mdat);
  mdat.append("mdat");
  mdat.append(payload);

  mp4.data = ftyp + free_box;
  if (options.moov_first) {
    mp4.data += moov;
    mp4.data += mdat;
  } else {
    mp4.data += mdat;
    mp4.data += moov;
  }
  CHECK_EQ(mp4.moov_end > mp4.mdat_end ? mp4.moov_end : mp4.mdat_end,
           static_cast<int64_t>(mp4.data.size()));
  return mp4;
}

}  // namespace reelstore
