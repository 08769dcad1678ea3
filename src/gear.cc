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
// gear.cc: the gear table. See gear.h.

#include "gear.h"

namespace reelstore {

const uint64_t kGearTable[256] = {
    UINT64_C(0x07e75dd15acd6178), UINT64_C(0xbe54a64ab63b2fe2),
    UINT64_C(0x656bc332f59d6ca0), UINT64_C(0x508bf55054dd8f9d),
    UINT64_C(0xaa460fcc7f22abb8), UINT64_C(0x6373e139e410ec23),
    UINT64_C(0x4b714be08f9c25f0), UINT64_C(0xdf92f05524fb0ea1),
    UINT64_C(0xbed403b3bbd0a91d), UINT64_C(0x1fba8fe32f377ba7),
    UINT64_C(0x05ee8468d3eb6df9), UINT64_C(0x073126580b81ba50),
    UINT64_C(0xd3bb3908c8bfbe30), UINT64_C(0x1d40c62d0f07d7ba),
    UINT64_C(0xfe7eecbe7d5804e7), UINT64_C(0x379b79e7da06eb65),
    UINT64_C(0x75199836ac9499cf), UINT64_C(0x18782cfdd98adc07),
    UINT64_C(0x161d77c6c52e54a3), UINT64_C(0xead6493b4047a7da),
    UINT64_C(0x828d1cd39937be3d), UINT64_C(0x82390634768c50cf),
    UINT64_C(0xdb427379ec834c6d), UINT64_C(0x93d54343e10ccafe),
    UINT64_C(0x0916f183dd070590), UINT64_C(0xf92ffa7534c6ecba),
    UINT64_C(0x767d72fe7a313409), UINT64_C(0xe53250eac60b8f8e),
    UINT64_C(0xe8f8d3e4fbeab411), UINT64_C(0x41754ac77ba58451),
    UINT64_C(0x4dcad667a77a5c2c), UINT64_C(0xb5303c3286384305),
    UINT64_C(0xb7ea347198d27b55), UINT64_C(0xc92ea8d51c053f34),
    UINT64_C(0xc129d21d6b40d228), UINT64_C(0xb5bab814961015f4),
    UINT64_C(0x6debaf1df09a574b), UINT64_C(0x50d987133faddf1b),
    UINT64_C(0x366b31e82b84e96f), UINT64_C(0xdce63e27c35b39b7),
    UINT64_C(0x19abca482b548d5c), UINT64_C(0xafc9cd515255fcfc),
    UINT64_C(0x8ceff767fc9aeebd), UINT64_C(0x389c404bb911a4e0),
    UINT64_C(0xd779c2dfec724080), UINT64_C(0xaa136af6664ad654),
    UINT64_C(0x716a6e074e901e5d), UINT64_C(0x15c0b1d7819981ca),
    UINT64_C(0x14ebba0fd13a39d9), UINT64_C(0x1ff1415cb7d0cb33),
    UINT64_C(0x7bf06a6173a81e2d), UINT64_C(0xd1decaec971cb9eb),
    UINT64_C(0x838ad20c728fb86b), UINT64_C(0xdcc6cc8d8d036027),
    UINT64_C(0x33231f6918e42e96), UINT64_C(0xc9d19e42bd2687ff),
    UINT64_C(0x9c851a15a0882285), UINT64_C(0xd2b56834c927f0be),
    UINT64_C(0x0f0c3f563544cb8c), UINT64_C(0x7a03c7fd4258f362),
    UINT64_C(0x5e9d915096f53a17), UINT64_C(0x3bd7701a87a3d6b6),
    UINT64_C(0x1e2675402fae0e70), UINT64_C(0x43d90936d61ae0b0),
    UINT64_C(0x40a275e33ce0dbd4), UINT64_C(0x60f98c8dd05cd010),
    UINT64_C(0x4a4641b08155c24c), UINT64_C(0x8fc304296061093b),
    UINT64_C(0xaf418190ca395ad9), UINT64_C(0x813c85745dbbdae4),
    UINT64_C(0xaf01451bf151add0), UINT64_C(0x6c72127da5637238),
    UINT64_C(0x196e06f4a644e620), UINT64_C(0x259a633ca2fcd2f3),
    UINT64_C(0x1139499ac32b934a), UINT64_C(0x7d948a02bb436df1),
    UINT64_C(0xe7add3b637a8e11f), UINT64_C(0x6d1c75fb29d8bbdc),
    UINT64_C(0x91c2d4c03b32b6fa), UINT64_C(0x807faa5be7442f83),
    UINT64_C(0xd7731cd3d815824c), UINT64_C(0xd10c186439bd9bf8),
    UINT64_C(0xc147897328c8aa92), UINT64_C(0x2cb9a668c249a19b),
    UINT64_C(0x13fc80a296ea8907), UINT64_C(0x01ebda7a57fa7ea6),
    UINT64_C(0x48732fc39a3be383), UINT64_C(0xf4e7574909ea5127),
    UINT64_C(0x0189b32132e7c447), UINT64_C(0xe691b5c003a1a06b),
    UINT64_C(0x5ee07d73d21b383d), UINT64_C(0xf6cabcb73469281a),
    UINT64_C(0x9924d5f85ad620a4), UINT64_C(0x48692fe837581609),
    UINT64_C(0x197937d6437658b8), UINT64_C(0xa4b7279299cfbda8),
    UINT64_C(0xd9911e059a7b3917), UINT64_C(0x1bfbf8b7c466b4a3),
    UINT64_C(0x52df5b6011ab46dc), UINT64_C(0x4d79f416117de20a),
    UINT64_C(0x67f64e1b14b2ef25), UINT64_C(0x26f6494d1fa9fd90),
    UINT64_C(0x755d3bde427a7c41), UINT64_C(0xe27d5790778db6c7),
    UINT64_C(0x7ab5402c61fb16a1), UINT64_C(0xa03a7f6714fe703f),
    UINT64_C(0x77e0c6da7031555c), UINT64_C(0x55d164561e77b4c1),
    UINT64_C(0x2a9c5219a256e0b3), UINT64_C(0x3ba3b65f6dc33d27),
    UINT64_C(0x527dc7323c0b80c4), UINT64_C(0xfa28bd702a5c6bd6),
    UINT64_C(0x6392c5ed94b25b8f), UINT64_C(0xcace91dfe3146815),
    UINT64_C(0xe7f274254cce3829), UINT64_C(0x7805d31dcb270141),
    UINT64_C(0x68f04bd2f373acc6), UINT64_C(0x9975204f0569bc1e),
    UINT64_C(0xbd13c5b4c6c02a2c), UINT64_C(0xb797c950afe7e06f),
    UINT64_C(0xda6c10504912f82a), UINT64_C(0xa63534402236cc8c),
    UINT64_C(0x2b3eb1cc56a31ff6), UINT64_C(0xa3c49f8f81d56f4b),
    UINT64_C(0x72129b4a09910dd1), UINT64_C(0xeed1b32511d6fefe),
    UINT64_C(0x4eea48f797e3d8d9), UINT64_C(0xe71bc87e44e4735e),
    UINT64_C(0xbfe96e827e2ad810), UINT64_C(0xff81807cb5855657),
    UINT64_C(0xca1ddbb53773edf0), UINT64_C(0x43d75d9ab7647f2c),
    UINT64_C(0x3348f698ac84d901), UINT64_C(0x36bee5aae5808008),
    UINT64_C(0xfc8df74fda808ca2), UINT64_C(0xd1462291e3458d74),
    UINT64_C(0x0bc4c289edec9947), UINT64_C(0xa23d128a6bee0928),
    UINT64_C(0x9d7507e4675f0225), UINT64_C(0x4cf79a25e9a14b76),
    UINT64_C(0x29bcf9e27c19dc57), UINT64_C(0x009d833220bf78a9),
    UINT64_C(0x6da5392000a36fb1), UINT64_C(0x77df2c62d8c61236),
    UINT64_C(0xb219374fef4f28f9), UINT64_C(0x67a809b7c4bb8a59),
    UINT64_C(0x17b25821e9bf6da2), UINT64_C(0x733dcd1ed6bae91d),
    UINT64_C(0x2fc39177a2ee8525), UINT64_C(0x6410fafa115b31b4),
    UINT64_C(0x19bce6b2356707de), UINT64_C(0x0a23ab133ee08997),
    UINT64_C(0x12a1b2ba84d24e8c), UINT64_C(0xcf7e7ed38034f552),
    UINT64_C(0x87edfc717fb16bbd), UINT64_C(0x000517771cad1155),
    UINT64_C(0xc65aaffe25d12e46), UINT64_C(0x960a4ef8a86a5373),
    UINT64_C(0x2f67c8ae22378019), UINT64_C(0xb8bc8d881f0635d4),
    UINT64_C(0xf8c23d97c6c5c598), UINT64_C(0x35c117dded9f441b),
    UINT64_C(0xa8b00f7a01967fc9), UINT64_C(0x74d16f5b38933235),
    UINT64_C(0xda626524f7ffc453), UINT64_C(0x7015ffda272b27ad),
    UINT64_C(0x87892cdb094b8d6f), UINT64_C(0xeb289825d425352f),
    UINT64_C(0x287ea7dfbbfde9fc), UINT64_C(0xaea4e8d135f57011),
    UINT64_C(0xf55991c3976c4369), UINT64_C(0x6b5874c6060bc182),
    UINT64_C(0xb6eb05fe2787c47b), UINT64_C(0x8665e886e1eed7c4),
    UINT64_C(0xf3e72cdf9e3197bf), UINT64_C(0x6ac43592f2243cee),
    UINT64_C(0xd6848e94fcd13111), UINT64_C(0x5dfb4b54995eb330),
    UINT64_C(0xba1d54d088c701fe), UINT64_C(0x764a7e59804536f5),
    UINT64_C(0x719335b0ad8eb0dc), UINT64_C(0x69c8324e2388a3d0),
    UINT64_C(0xbe4ae144689da593), UINT64_C(0x3bb14dd3b5af75c1),
    UINT64_C(0x04a074e920fedb35), UINT64_C(0x48637234ac1435d5),
    UINT64_C(0xf42d7d1389a65a3d), UINT64_C(0xa22fdac06ddfc924),
    UINT64_C(0xbcd71999fe4a2248), UINT64_C(0x740dfa62e8632428),
    UINT64_C(0xa9b65491c2f16186), UINT64_C(0x79ce28b7406e2440),
    UINT64_C(0x09ba07bb08ee175c), UINT64_C(0x62f1feba671cc7f2),
    UINT64_C(0x5cd18a7f53014ae6), UINT64_C(0x2ce609f702240d27),
    UINT64_C(0xf03de9412fe0e423), UINT64_C(0x8c6b593941db0a53),
    UINT64_C(0x260388a8ec56d9e6), UINT64_C(0xd9d27e2039a262df),
    UINT64_C(0x8fa5c722dde5efbc), UINT64_C(0x40821084c5aacb61),
    UINT64_C(0x1b2f3e15414c5c5e), UINT64_C(0xbb046c2b6993cbb0),
    UINT64_C(0xef4292093d40940a), UINT64_C(0x969ee5c5a60772b4),
    UINT64_C(0x807f4030f0888530), UINT64_C(0xaf18c17850ca8fa3),
    UINT64_C(0xbec99f56e235fef2), UINT64_C(0x88813f76fbf85a7f),
    UINT64_C(0x919a5d5f9db2e2e6), UINT64_C(0xcb6191dda2d65a13),
    UINT64_C(0x827d82cfba70f97c), UINT64_C(0xf5b626de8d34f55c),
    UINT64_C(0xc00bf837f8574823), UINT64_C(0x290e8e8e3f5cb67a),
    UINT64_C(0x7845b5ed26e91b77), UINT64_C(0x6f39d873f60fb2fd),
    UINT64_C(0xd5d23b6b137cc91d), UINT64_C(0x042609079b60ab8f),
    UINT64_C(0x768d76689f35c0ac), UINT64_C(0xc1883f2a9ee49c71),
    UINT64_C(0xa1dceeae252b96d6), UINT64_C(0x0ed62c42e705f287),
    UINT64_C(0x3ada201b796316d4), UINT64_C(0xd4531904f506011a),
    UINT64_C(0xe2f7f7b6e2a8b17c), UINT64_C(0x1f4d20d8be47be80),
    UINT64_C(0x5ff66a0c2079e0f4), UINT64_C(0x1c4d2eb545c6b2cd),
    UINT64_C(0x3bc44fe9b28622df), UINT64_C(0x4c56a2e0d5d6f27b),
    UINT64_C(0x20ecc7352276ccfb), UINT64_C(0xf107c989760d03ab),
    UINT64_C(0xd3264fec7d717092), UINT64_C(0xa6b0ab0ba94a4c1c),
    UINT64_C(0xcde2a680a05e2ca9), UINT64_C(0xe51ff68b8ac144c1),
    UINT64_C(0x8544d1d803eb8705), UINT64_C(0x08de58591e344de7),
    UINT64_C(0xf8fd9cd32fb37f91), UINT64_C(0x2ad8c517bb5fb7ea),
    UINT64_C(0x24fa2c39d63c4faf), UINT64_C(0xe87cd486d5d5bd87),
    UINT64_C(0x3363af904ebce216), UINT64_C(0x5590788c18a29b19),
    UINT64_C(0xa0c3871bbe315478), UINT64_C(0xf8229dcfc4790343),
    UINT64_C(0xfb57efd12bc11e6b), UINT64_C(0xbf42b366391fabb4),
    UINT64_C(0x0404a8615eb875df), UINT64_C(0x940c0727e252d570),
    UINT64_C(0x3504eb5501092b58), UINT64_C(0xff37f6c623780e91),
    UINT64_C(0x779d6ca7ca3f4894), UINT64_C(0x7a006f61e03ed63e),
};

uint64_t GenerateGearEntry(int i) {
  uint64_t s = kGearSeed;
  for (int j = 0; j <= i; ++j) {
    s += UINT64_C(0x9e3779b97f4a7c15);
  }
  uint64_t z = s;
  z = (z ^ (z >> 30)) * UINT64_C(0xbf58476d1ce4e5b9);
  z = (z ^ (z >> 27)) * UINT64_C(0x94d049bb133111eb);
  return z ^ (z >> 31);
}

}  // namespace reelstore
