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
// manifest.h: manifests, the recipes for reconstructing stored files from
// their chunks.
//
// A ManifestEntry lists one file's chunks in file order. For ISOBMFF files it
// also records the file's top-level layout as regions, each covering whole
// chunks, so the file can be reconstructed either in its original order or
// in "fast start" order (ftyp, moov, other metadata, mdat). When the entry's
// |offsets_normalized| is set, the stored moov's stco/co64 entries are
// relative to the start of the mdat payload and are re-based on the way out.
//
// Entries and records are serialized as varints behind a version tag. Every
// decoded field is validated before use.

#ifndef REELSTORE_MANIFEST_H
#define REELSTORE_MANIFEST_H

#include <stdint.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <re2/stringpiece.h>

#include "chunk-store.h"
#include "common.h"
#include "crypto.h"
#include "filesystem.h"
#include "isobmff.h"
#include "slices.h"
#include "uuid.h"

namespace reelstore {

struct ChunkRef {
  enum Flags : uint32_t {
    kKeyframeAligned = 1,  // the chunk starts at a video keyframe.
    kMetadata = 2,         // the chunk holds container metadata.
    kCompressed = 4,
    kEncrypted = 8,
  };
  static constexpr uint32_t kAllFlags = 15;

  ChunkRef() {}
  ChunkRef(const ContentAddress &address, int64_t offset, int64_t length,
           uint32_t flags)
      : address(address), offset(offset), length(length), flags(flags) {}

  ContentAddress address;
  int64_t offset = 0;  // within the file, in its original layout.
  int64_t length = 0;
  uint32_t flags = 0;

  bool operator==(const ChunkRef &o) const {
    return address == o.address && offset == o.offset && length == o.length &&
           flags == o.flags;
  }
};

struct ManifestRegion {
  ManifestRegion() {}
  ManifestRegion(ByteRange range, RegionKind kind, uint32_t box_type)
      : range(range), kind(kind), box_type(box_type) {}

  ByteRange range;  // position in the original file.
  RegionKind kind = RegionKind::kPayload;
  uint32_t box_type = 0;

  // Indices into ManifestEntry::chunks of the chunks covering |range|.
  size_t first_chunk = 0;
  size_t end_chunk = 0;
};

struct FileMetadata {
  uint32_t mode = 0644;
  int64_t mtime_sec = 0;
};

struct ManifestEntry {
  std::string path;
  int64_t size = 0;
  ContentAddress full_content_hash;
  std::vector<ChunkRef> chunks;

  // Empty unless the file is an ISOBMFF container.
  std::vector<ManifestRegion> regions;
  bool offsets_normalized = false;

  // Original offset of the only mdat payload, or -1.
  int64_t payload_pos = -1;

  FileMetadata file_metadata;

  // Optional descriptive metadata (codec, duration, and so on).
  std::map<std::string, std::string> asset_metadata;

  bool is_container() const { return !regions.empty(); }
};

// Assembles a ManifestEntry from already-stored chunks. |chunks| must be
// contiguous from offset 0; if |map| describes a container, each of its
// regions must start and end on chunk boundaries.
bool BuildManifestEntry(const std::string &path, const FileMetadata &metadata,
                        const ContentAddress &full_content_hash,
                        std::vector<ChunkRef> chunks, const StructureMap &map,
                        bool offsets_normalized, ManifestEntry *entry,
                        std::string *error_message);

// Returns the index of the chunk covering byte |offset| of the file's
// original layout, or -1 if |offset| is outside [0, size).
int FindChunkForOffset(const ManifestEntry &entry, int64_t offset);

void EncodeManifestEntry(const ManifestEntry &entry, std::string *out);
bool DecodeManifestEntry(re2::StringPiece in, ManifestEntry *entry,
                         std::string *error_message);

struct ManifestStats {
  int64_t files = 0;
  int64_t bytes = 0;
  int64_t chunk_refs = 0;
  int64_t unique_chunks = 0;
};

// A snapshot of a repository's manifests, as exchanged with a sync layer.
struct ManifestRecord {
  static constexpr uint32_t kVersion = 1;

  Uuid repository_id;
  ContentAddress commit;  // see ComputeCommitHash.
  bool has_parent = false;
  ContentAddress parent;

  // Sorted by path.
  std::vector<ManifestEntry> entries;
  ManifestStats stats;
  std::string signature;  // optional; opaque.
};

// Fills |record->stats| from |record->entries|.
void ComputeManifestStats(ManifestRecord *record);

// Returns the hash of |record|'s encoding with |commit| and |signature|
// cleared.
ContentAddress ComputeCommitHash(const Hasher &hasher,
                                 const ManifestRecord &record);

void EncodeManifestRecord(const ManifestRecord &record, std::string *out);
bool DecodeManifestRecord(re2::StringPiece in, ManifestRecord *record,
                          std::string *error_message);

enum class Layout {
  kOriginal,

  // ftyp, moov, other metadata, then mdat. Requires a container with
  // normalized offsets.
  kFastStart,
};

// A file reconstructed from a manifest, readable at any offset. Chunks are
// fetched from the store (and so verified) only as reads reach them.
class VirtualFile {
 public:
  // |store| and |entry| must outlive the VirtualFile. Fetches the moov
  // immediately if its offsets must be re-based.
  static ErrorKind Open(ChunkStore *store, const ManifestEntry *entry,
                        Layout layout, std::unique_ptr<VirtualFile> *file,
                        std::string *error_message);

  VirtualFile(const VirtualFile &) = delete;
  void operator=(const VirtualFile &) = delete;

  int64_t size() const { return slices_.size(); }

  // Reads up to |length| bytes at |offset|, stopping at the end of file.
  ErrorKind ReadAt(int64_t offset, int64_t length, std::string *out,
                   std::string *error_message);

  // Writes the whole file to |out|. In the original layout, also checks the
  // result against the entry's full_content_hash (kCorruption on mismatch).
  ErrorKind WriteTo(File *out, std::string *error_message);

 private:
  VirtualFile(ChunkStore *store, const ManifestEntry *entry, Layout layout)
      : store_(store), entry_(entry), layout_(layout) {}

  // Appends the chunks [first, end) as lazily fetched slices.
  void AppendChunks(size_t first, size_t end);

  // Appends |data| as a slice backed by this object.
  void AppendOwned(std::string data);

  // Fetches one chunk, treating an absent chunk as a broken manifest.
  ErrorKind FetchChunk(const ChunkRef &ref, std::string *data,
                       std::string *error_message);

  ErrorKind FetchRegion(const ManifestRegion &region, std::string *out,
                        std::string *error_message);

  ChunkStore *store_;
  const ManifestEntry *entry_;
  Layout layout_;
  FileSlices slices_;
  std::vector<std::unique_ptr<FileSlice>> owned_slices_;
  std::vector<std::unique_ptr<std::string>> owned_data_;

  // The kind of the last failed chunk fetch.
  ErrorKind fetch_error_ = ErrorKind::kOk;
};

}  // namespace reelstore

#endif  // REELSTORE_MANIFEST_H
