#include "translit.hh"

#include <algorithm>
#include <iterator>

namespace lexcmp {
namespace {

constexpr char ascii[] =
  "\x00\x01\x02\x03\x04\x05\x06\x07\x08\x09\x0A\x0B\x0C\x0D\x0E\x0F"
  "\x10\x11\x12\x13\x14\x15\x16\x17\x18\x19\x1A\x1B\x1C\x1D\x1E\x1F"
  " !\"#$%&'()*+,-./0123456789:;<=>?"
  "@ABCDEFGHIJKLMNOPQRSTUVWXYZ[\\]^_"
  "`abcdefghijklmnopqrstuvwxyz{|}~\x7F";
static_assert(sizeof(ascii) == 0x81);

// Dense blocks, indexed by offset from the first code point of the block.
// "" marks characters without an ASCII spelling.

constexpr std::string_view latin[] = {
  /* 0080 */ "", "", "", "", "", "", "", "",
  /* 0088 */ "", "", "", "", "", "", "", "",
  /* 0090 */ "", "", "", "", "", "", "", "",
  /* 0098 */ "", "", "", "", "", "", "", "",
  /* 00A0 */ " ", "!", "c", "L", "$", "Y", "|", "SS",
  /* 00A8 */ "\"", "(c)", "a", "<<", "!", "-", "(r)", "-",
  /* 00B0 */ "deg", "+-", "2", "3", "'", "u", "P", ".",
  /* 00B8 */ ",", "1", "o", ">>", "1/4", "1/2", "3/4", "?",
  /* 00C0 */ "A", "A", "A", "A", "A", "A", "AE", "C",
  /* 00C8 */ "E", "E", "E", "E", "I", "I", "I", "I",
  /* 00D0 */ "D", "N", "O", "O", "O", "O", "O", "x",
  /* 00D8 */ "O", "U", "U", "U", "U", "Y", "Th", "ss",
  /* 00E0 */ "a", "a", "a", "a", "a", "a", "ae", "c",
  /* 00E8 */ "e", "e", "e", "e", "i", "i", "i", "i",
  /* 00F0 */ "d", "n", "o", "o", "o", "o", "o", "/",
  /* 00F8 */ "o", "u", "u", "u", "u", "y", "th", "y",
  /* 0100 */ "A", "a", "A", "a", "A", "a", "C", "c",
  /* 0108 */ "C", "c", "C", "c", "C", "c", "D", "d",
  /* 0110 */ "D", "d", "E", "e", "E", "e", "E", "e",
  /* 0118 */ "E", "e", "E", "e", "G", "g", "G", "g",
  /* 0120 */ "G", "g", "G", "g", "H", "h", "H", "h",
  /* 0128 */ "I", "i", "I", "i", "I", "i", "I", "i",
  /* 0130 */ "I", "i", "IJ", "ij", "J", "j", "K", "k",
  /* 0138 */ "k", "L", "l", "L", "l", "L", "l", "L",
  /* 0140 */ "l", "L", "l", "N", "n", "N", "n", "N",
  /* 0148 */ "n", "'n", "NG", "ng", "O", "o", "O", "o",
  /* 0150 */ "O", "o", "OE", "oe", "R", "r", "R", "r",
  /* 0158 */ "R", "r", "S", "s", "S", "s", "S", "s",
  /* 0160 */ "S", "s", "T", "t", "T", "t", "T", "t",
  /* 0168 */ "U", "u", "U", "u", "U", "u", "U", "u",
  /* 0170 */ "U", "u", "U", "u", "W", "w", "Y", "y",
  /* 0178 */ "Y", "Z", "z", "Z", "z", "Z", "z", "s",
  /* 0180 */ "b", "B", "B", "b", "6", "6", "O", "C",
  /* 0188 */ "c", "D", "D", "D", "d", "d", "E", "E",
  /* 0190 */ "E", "F", "f", "G", "G", "hv", "I", "I",
  /* 0198 */ "K", "k", "l", "l", "M", "N", "n", "O",
  /* 01A0 */ "O", "o", "OI", "oi", "P", "p", "YR", "2",
  /* 01A8 */ "2", "SH", "sh", "t", "T", "t", "T", "U",
  /* 01B0 */ "u", "U", "V", "Y", "y", "Z", "z", "ZH",
  /* 01B8 */ "ZH", "zh", "zh", "2", "5", "5", "ts", "w",
  /* 01C0 */ "|", "||", "|=", "!", "DZ", "Dz", "dz", "LJ",
  /* 01C8 */ "Lj", "lj", "NJ", "Nj", "nj", "A", "a", "I",
  /* 01D0 */ "i", "O", "o", "U", "u", "U", "u", "U",
  /* 01D8 */ "u", "U", "u", "U", "u", "e", "A", "a",
  /* 01E0 */ "A", "a", "AE", "ae", "G", "g", "G", "g",
  /* 01E8 */ "K", "k", "O", "o", "O", "o", "ZH", "zh",
  /* 01F0 */ "j", "DZ", "Dz", "dz", "G", "g", "HV", "W",
  /* 01F8 */ "N", "n", "A", "a", "AE", "ae", "O", "o",
  /* 0200 */ "A", "a", "A", "a", "E", "e", "E", "e",
  /* 0208 */ "I", "i", "I", "i", "O", "o", "O", "o",
  /* 0210 */ "R", "r", "R", "r", "U", "u", "U", "u",
  /* 0218 */ "S", "s", "T", "t", "Y", "y", "H", "h",
  /* 0220 */ "N", "d", "OU", "ou", "Z", "z", "A", "a",
  /* 0228 */ "E", "e", "O", "o", "O", "o", "O", "o",
  /* 0230 */ "O", "o", "Y", "y", "l", "n", "t", "j",
  /* 0238 */ "db", "qp", "A", "C", "c", "L", "T", "s",
  /* 0240 */ "z", "?", "?", "B", "U", "V", "E", "e",
  /* 0248 */ "J", "j", "Q", "q", "R", "r", "Y", "y",
};
static_assert(std::size(latin) == 0x1D0);

constexpr std::string_view greek[] = {
  /* 0370 */ "H", "h", "T", "t", "'", ",", "W", "w",
  /* 0378 */ "", "", "i", "c", "c", "c", "?", "J",
  /* 0380 */ "", "", "", "", "'", "'", "A", ".",
  /* 0388 */ "E", "E", "I", "", "O", "", "U", "O",
  /* 0390 */ "i", "A", "B", "G", "D", "E", "Z", "E",
  /* 0398 */ "Th", "I", "K", "L", "M", "N", "X", "O",
  /* 03A0 */ "P", "R", "", "S", "T", "U", "Ph", "Kh",
  /* 03A8 */ "Ps", "O", "I", "U", "a", "e", "e", "i",
  /* 03B0 */ "u", "a", "b", "g", "d", "e", "z", "e",
  /* 03B8 */ "th", "i", "k", "l", "m", "n", "x", "o",
  /* 03C0 */ "p", "r", "s", "s", "t", "u", "ph", "kh",
  /* 03C8 */ "ps", "o", "i", "u", "o", "u", "o", "K",
  /* 03D0 */ "b", "th", "U", "U", "U", "ph", "p", "&",
  /* 03D8 */ "Q", "q", "St", "st", "W", "w", "Q", "q",
  /* 03E0 */ "Sp", "sp", "Sh", "sh", "F", "f", "Kh", "kh",
  /* 03E8 */ "H", "h", "G", "g", "Ch", "ch", "Ti", "ti",
  /* 03F0 */ "k", "r", "s", "j", "Th", "e", "e", "Sh",
  /* 03F8 */ "sh", "S", "S", "s", "r", "S", "S", "S",
};
static_assert(std::size(greek) == 0x90);

constexpr std::string_view cyrillic[] = {
  /* 0400 */ "E", "E", "Dj", "Gj", "Ie", "Dz", "I", "Yi",
  /* 0408 */ "J", "Lj", "Nj", "C", "Kj", "I", "U", "Dzh",
  /* 0410 */ "A", "B", "V", "G", "D", "E", "Zh", "Z",
  /* 0418 */ "I", "Y", "K", "L", "M", "N", "O", "P",
  /* 0420 */ "R", "S", "T", "U", "F", "Kh", "Ts", "Ch",
  /* 0428 */ "Sh", "Shch", "'", "Y", "'", "E", "Yu", "Ya",
  /* 0430 */ "a", "b", "v", "g", "d", "e", "zh", "z",
  /* 0438 */ "i", "y", "k", "l", "m", "n", "o", "p",
  /* 0440 */ "r", "s", "t", "u", "f", "kh", "ts", "ch",
  /* 0448 */ "sh", "shch", "'", "y", "'", "e", "yu", "ya",
  /* 0450 */ "e", "e", "dj", "gj", "ie", "dz", "i", "yi",
  /* 0458 */ "j", "lj", "nj", "c", "kj", "i", "u", "dzh",
};
static_assert(std::size(cyrillic) == 0x60);

constexpr std::string_view latin_additional[] = {
  /* 1E00 */ "A", "a", "B", "b", "B", "b", "B", "b",
  /* 1E08 */ "C", "c", "D", "d", "D", "d", "D", "d",
  /* 1E10 */ "D", "d", "D", "d", "E", "e", "E", "e",
  /* 1E18 */ "E", "e", "E", "e", "E", "e", "F", "f",
  /* 1E20 */ "G", "g", "H", "h", "H", "h", "H", "h",
  /* 1E28 */ "H", "h", "H", "h", "I", "i", "I", "i",
  /* 1E30 */ "K", "k", "K", "k", "K", "k", "L", "l",
  /* 1E38 */ "L", "l", "L", "l", "L", "l", "M", "m",
  /* 1E40 */ "M", "m", "M", "m", "N", "n", "N", "n",
  /* 1E48 */ "N", "n", "N", "n", "O", "o", "O", "o",
  /* 1E50 */ "O", "o", "O", "o", "P", "p", "P", "p",
  /* 1E58 */ "R", "r", "R", "r", "R", "r", "R", "r",
  /* 1E60 */ "S", "s", "S", "s", "S", "s", "S", "s",
  /* 1E68 */ "S", "s", "T", "t", "T", "t", "T", "t",
  /* 1E70 */ "T", "t", "U", "u", "U", "u", "U", "u",
  /* 1E78 */ "U", "u", "U", "u", "V", "v", "V", "v",
  /* 1E80 */ "W", "w", "W", "w", "W", "w", "W", "w",
  /* 1E88 */ "W", "w", "X", "x", "X", "x", "Y", "y",
  /* 1E90 */ "Z", "z", "Z", "z", "Z", "z", "h", "t",
  /* 1E98 */ "w", "y", "a", "s", "s", "s", "SS", "d",
  /* 1EA0 */ "A", "a", "A", "a", "A", "a", "A", "a",
  /* 1EA8 */ "A", "a", "A", "a", "A", "a", "A", "a",
  /* 1EB0 */ "A", "a", "A", "a", "A", "a", "A", "a",
  /* 1EB8 */ "E", "e", "E", "e", "E", "e", "E", "e",
  /* 1EC0 */ "E", "e", "E", "e", "E", "e", "E", "e",
  /* 1EC8 */ "I", "i", "I", "i", "O", "o", "O", "o",
  /* 1ED0 */ "O", "o", "O", "o", "O", "o", "O", "o",
  /* 1ED8 */ "O", "o", "O", "o", "O", "o", "O", "o",
  /* 1EE0 */ "O", "o", "O", "o", "U", "u", "U", "u",
  /* 1EE8 */ "U", "u", "U", "u", "U", "u", "U", "u",
  /* 1EF0 */ "U", "u", "Y", "y", "Y", "y", "Y", "y",
  /* 1EF8 */ "Y", "y", "LL", "ll", "V", "v", "Y", "y",
};
static_assert(std::size(latin_additional) == 0x100);

constexpr std::string_view punctuation[] = {
  /* 2000 */ " ", " ", " ", " ", " ", " ", " ", " ",
  /* 2008 */ " ", " ", " ", "", "", "", "", "",
  /* 2010 */ "-", "-", "-", "-", "--", "--", "||", "_",
  /* 2018 */ "'", "'", ",", "'", "\"", "\"", ",,", "\"",
  /* 2020 */ "+", "++", "*", ">", ".", "..", "...", ".",
  /* 2028 */ "", "", "", "", "", "", "", " ",
  /* 2030 */ "%0", "%00", "'", "''", "'''", "`", "``", "```",
  /* 2038 */ "^", "<", ">", "*", "!!", "?!", "-", "_",
  /* 2040 */ "-", "^", "***", "-", "/", "[", "]", "??",
  /* 2048 */ "?!", "!?", "7", "P", "<", ">", "*", ";",
  /* 2050 */ "~", "**", "%", "~", "_", "*", "...", "''''",
  /* 2058 */ "....", ".....", ":", "....", "+", ":", ":", " ",
  /* 2060 */ "", "", "", "", "", "", "", "",
  /* 2068 */ "", "", "", "", "", "", "", "",
  /* 2070 */ "0", "i", "", "", "4", "5", "6", "7",
  /* 2078 */ "8", "9", "+", "-", "=", "(", ")", "n",
  /* 2080 */ "0", "1", "2", "3", "4", "5", "6", "7",
  /* 2088 */ "8", "9", "+", "-", "=", "(", ")", "",
  /* 2090 */ "a", "e", "o", "x", "e", "h", "k", "l",
  /* 2098 */ "m", "n", "p", "s", "t", "", "", "",
  /* 20A0 */ "ECU", "CL", "Cr", "Fr", "L", "mil", "N", "Pts",
  /* 20A8 */ "Rs", "W", "NS", "d", "EUR", "K", "T", "Dr",
  /* 20B0 */ "Pf", "P", "G", "A", "UAH", "C", "L", "Sm",
  /* 20B8 */ "T", "Rs", "TL", "M", "m", "R", "GEL", "BTC",
  /* 20C0 */ "som", "", "", "", "", "", "", "",
  /* 20C8 */ "", "", "", "", "", "", "", "",
};
static_assert(std::size(punctuation) == 0xD0);

constexpr std::string_view letterlike[] = {
  /* 2100 */ "a/c", "a/s", "C", "C", "CL", "c/o", "c/u", "E",
  /* 2108 */ "E", "F", "g", "H", "H", "H", "h", "h",
  /* 2110 */ "I", "I", "L", "l", "lb", "N", "No", "(p)",
  /* 2118 */ "P", "P", "Q", "R", "R", "R", "Rx", "R",
  /* 2120 */ "SM", "TEL", "TM", "V", "Z", "oz", "O", "mho",
  /* 2128 */ "Z", "i", "K", "A", "B", "C", "e", "e",
  /* 2130 */ "E", "F", "F", "M", "o", "alef", "bet", "gimel",
  /* 2138 */ "dalet", "i", "Q", "FAX", "pi", "g", "G", "P",
  /* 2140 */ "S", "G", "L", "L", "Y", "D", "d", "e",
  /* 2148 */ "i", "j", "PL", "&", "per", "A/S", "f", "",
  /* 2150 */ "1/7", "1/9", "1/10", "1/3", "2/3", "1/5", "2/5", "3/5",
  /* 2158 */ "4/5", "1/6", "5/6", "1/8", "3/8", "5/8", "7/8", "1/",
  /* 2160 */ "I", "II", "III", "IV", "V", "VI", "VII", "VIII",
  /* 2168 */ "IX", "X", "XI", "XII", "L", "C", "D", "M",
  /* 2170 */ "i", "ii", "iii", "iv", "v", "vi", "vii", "viii",
  /* 2178 */ "ix", "x", "xi", "xii", "l", "c", "d", "m",
  /* 2180 */ "M", "D", "X", "C", "c", "6", "50", "50000",
  /* 2188 */ "100000", "0/3", "2", "3", "", "", "", "",
};
static_assert(std::size(letterlike) == 0x90);

constexpr std::string_view ligatures[] = {
  "ff", "fi", "fl", "ffi", "ffl", "st", "st"
};

// Miscellaneous Symbols, Dingbats
constexpr std::string_view misc_symbols[] = {
  /* 2600 */ "sun", "cloud", "umbrella", "snowman", "comet", "*", "*",
  /* 2607 */ "lightning", "thunderstorm", "sun", "ascending_node",
  /* 260B */ "descending_node", "conjunction", "opposition", "telephone",
  /* 260F */ "white_telephone", "ballot_box", "ballot_box_with_check",
  /* 2612 */ "ballot_box_with_x", "saltire", "umbrella", "coffee",
  /* 2616 */ "white_shogi_piece", "black_shogi_piece", "shamrock",
  /* 2619 */ "reversed_rotated_floral_heart_bullet",
  /* 261A */ "black_left_pointing_index", "black_right_pointing_index",
  /* 261C */ "white_left_pointing_index", "point_up",
  /* 261E */ "white_right_pointing_index", "white_down_pointing_index",
  /* 2620 */ "skull", "caution_sign", "radioactive", "biohazard_sign",
  /* 2624 */ "caduceus", "ankh", "orthodox_cross", "chi_rho",
  /* 2628 */ "cross_of_lorraine", "cross_of_jerusalem", "star_and_crescent",
  /* 262B */ "farsi_symbol", "adi_shakti", "hammer_and_sickle", "peace",
  /* 262F */ "yin_yang", "trigram_for_heaven", "trigram_for_lake",
  /* 2632 */ "trigram_for_fire", "trigram_for_thunder", "trigram_for_wind",
  /* 2635 */ "trigram_for_water", "trigram_for_mountain", "trigram_for_earth",
  /* 2638 */ "wheel_of_dharma", "frowning", "smiley", "black_smiling_face",
  /* 263C */ "white_sun_with_rays", "first_quarter_moon", "last_quarter_moon",
  /* 263F */ "mercury", "female", "earth", "male", "jupiter", "saturn",
  /* 2645 */ "uranus", "neptune", "pluto", "aries", "taurus", "gemini",
  /* 264B */ "cancer", "leo", "virgo", "libra", "scorpius", "sagittarius",
  /* 2651 */ "capricorn", "aquarius", "pisces", "white_chess_king",
  /* 2655 */ "white_chess_queen", "white_chess_rook", "white_chess_bishop",
  /* 2658 */ "white_chess_knight", "white_chess_pawn", "black_chess_king",
  /* 265B */ "black_chess_queen", "black_chess_rook", "black_chess_bishop",
  /* 265E */ "black_chess_knight", "black_chess_pawn", "spades",
  /* 2661 */ "white_heart_suit", "white_diamond_suit", "clubs",
  /* 2664 */ "white_spade_suit", "hearts", "diamonds", "white_club_suit",
  /* 2668 */ "hot_springs", "quarter_note", "note", "notes",
  /* 266C */ "beamed_sixteenth_notes", "music_flat_sign", "music_natural_sign",
  /* 266F */ "music_sharp_sign", "west_syriac_cross", "east_syriac_cross",
  /* 2672 */ "universal_recycling_symbol",
  /* 2673 */ "recycling_symbol_for_type_1_plastics",
  /* 2674 */ "recycling_symbol_for_type_2_plastics",
  /* 2675 */ "recycling_symbol_for_type_3_plastics",
  /* 2676 */ "recycling_symbol_for_type_4_plastics",
  /* 2677 */ "recycling_symbol_for_type_5_plastics",
  /* 2678 */ "recycling_symbol_for_type_6_plastics",
  /* 2679 */ "recycling_symbol_for_type_7_plastics",
  /* 267A */ "recycling_symbol_for_generic_materials", "recycle",
  /* 267C */ "recycled_paper_symbol", "partially_recycled_paper_symbol",
  /* 267E */ "permanent_paper_sign", "wheelchair_symbol", "die_face_1",
  /* 2681 */ "die_face_2", "die_face_3", "die_face_4", "die_face_5",
  /* 2685 */ "die_face_6", "white_circle_with_dot_right",
  /* 2687 */ "white_circle_with_two_dots", "black_circle_with_white_dot_right",
  /* 2689 */ "black_circle_with_two_white_dots", "monogram_for_yang",
  /* 268B */ "monogram_for_yin", "digram_for_greater_yang",
  /* 268D */ "digram_for_lesser_yin", "digram_for_lesser_yang",
  /* 268F */ "digram_for_greater_yin", "white_flag", "black_flag",
  /* 2692 */ "hammer_and_pick", "anchor", "crossed_swords",
  /* 2695 */ "staff_of_aesculapius", "scales", "alembic", "flower", "gear",
  /* 269A */ "staff_of_hermes", "atom_symbol", "fleur_de_lis",
  /* 269D */ "outlined_white_star", "three_lines_converging_right",
  /* 269F */ "three_lines_converging_left", "warning", "zap",
  /* 26A2 */ "doubled_female_sign", "doubled_male_sign",
  /* 26A4 */ "interlocked_female_and_male_sign", "male_and_female_sign",
  /* 26A6 */ "male_with_stroke_sign",
  /* 26A7 */ "male_with_stroke_and_male_and_female_sign",
  /* 26A8 */ "vertical_male_with_stroke_sign",
  /* 26A9 */ "horizontal_male_with_stroke_sign", "medium_white_circle",
  /* 26AB */ "medium_black_circle", "medium_small_white_circle",
  /* 26AD */ "marriage_symbol", "divorce_symbol",
  /* 26AF */ "unmarried_partnership_symbol", "coffin", "funeral_urn", "neuter",
  /* 26B3 */ "ceres", "pallas", "juno", "vesta", "chiron", "black_moon_lilith",
  /* 26B9 */ "sextile", "semisextile", "quincunx", "sesquiquadrate", "soccer",
  /* 26BE */ "baseball", "squared_key", "white_draughts_man",
  /* 26C1 */ "white_draughts_king", "black_draughts_man",
  /* 26C3 */ "black_draughts_king", "snowman_without_snow", "sun_behind_cloud",
  /* 26C6 */ "rain", "black_snowman", "thunder_cloud_and_rain",
  /* 26C9 */ "turned_white_shogi_piece", "turned_black_shogi_piece",
  /* 26CB */ "white_diamond_in_square", "crossing_lanes", "disabled_car",
  /* 26CE */ "ophiuchus", "pick", "car_sliding", "helmet_with_white_cross",
  /* 26D2 */ "circled_crossing_lanes", "chains", "no_entry",
  /* 26D5 */ "alternate_one_way_left_way_traffic",
  /* 26D6 */ "black_two_way_left_way_traffic",
  /* 26D7 */ "white_two_way_left_way_traffic", "black_left_lane_merge",
  /* 26D9 */ "white_left_lane_merge", "drive_slow_sign",
  /* 26DB */ "heavy_white_down_pointing_triangle", "left_closed_entry",
  /* 26DD */ "squared_saltire",
  /* 26DE */ "falling_diagonal_in_white_circle_in_black_square", "black_truck",
  /* 26E0 */ "restricted_left_entry_1", "restricted_left_entry_2",
  /* 26E2 */ "astronomical_symbol_for_uranus",
  /* 26E3 */ "heavy_circle_with_stroke_and_two_dots_above", "pentagram",
  /* 26E5 */ "right_handed_interlaced_pentagram",
  /* 26E6 */ "left_handed_interlaced_pentagram", "inverted_pentagram",
  /* 26E8 */ "black_cross_on_shield", "shinto_shrine", "church", "castle",
  /* 26EC */ "historic_site", "gear_without_hub", "gear_with_handles",
  /* 26EF */ "map_symbol_for_lighthouse", "mountain", "umbrella_on_ground",
  /* 26F2 */ "fountain", "flag_in_hole", "ferry", "sailboat",
  /* 26F6 */ "square_four_corners", "skier", "ice_skate", "person_with_ball",
  /* 26FA */ "tent", "japanese_bank_symbol", "headstone_graveyard_symbol",
  /* 26FD */ "fuel_pump", "cup_on_black_square",
  /* 26FF */ "white_flag_with_horizontal_middle_black_stripe",
  /* 2700 */ "black_safety_scissors", "upper_blade_scissors", "black_scissors",
  /* 2703 */ "lower_blade_scissors", "white_scissors",
  /* 2705 */ "white_heavy_check_mark", "telephone_location_sign", "tape_drive",
  /* 2708 */ "airplane", "envelope", "raised_fist", "raised_hand",
  /* 270C */ "victory_hand", "writing_hand", "lower_right_pencil", "pencil",
  /* 2710 */ "upper_right_pencil", "white_nib", "black_nib", "check_mark",
  /* 2714 */ "check", "multiplication_x", "x", "ballot_x", "heavy_ballot_x",
  /* 2719 */ "outlined_greek_cross", "heavy_greek_cross", "open_centre_cross",
  /* 271C */ "heavy_open_centre_cross", "cross", "shadowed_white_latin_cross",
  /* 271F */ "outlined_latin_cross", "maltese_cross", "star_of_david",
  /* 2722 */ "four_teardrop_spoked_asterisk", "four_balloon_spoked_asterisk",
  /* 2724 */ "heavy_four_balloon_spoked_asterisk", "four_club_spoked_asterisk",
  /* 2726 */ "black_four_pointed_star", "white_four_pointed_star", "sparkles",
  /* 2729 */ "stress_outlined_white_star", "circled_white_star",
  /* 272B */ "open_centre_black_star", "black_centre_white_star",
  /* 272D */ "outlined_black_star", "heavy_outlined_black_star",
  /* 272F */ "pinwheel_star", "shadowed_white_star", "heavy_asterisk",
  /* 2732 */ "open_centre_asterisk", "eight_spoked_asterisk",
  /* 2734 */ "eight_pointed_black_star", "eight_pointed_pinwheel_star",
  /* 2736 */ "six_pointed_black_star", "eight_pointed_rectilinear_black_star",
  /* 2738 */ "heavy_eight_pointed_rectilinear_black_star",
  /* 2739 */ "twelve_pointed_black_star", "sixteen_pointed_asterisk",
  /* 273B */ "teardrop_spoked_asterisk",
  /* 273C */ "open_centre_teardrop_spoked_asterisk",
  /* 273D */ "heavy_teardrop_spoked_asterisk",
  /* 273E */ "six_petalled_black_and_white_florette", "black_florette",
  /* 2740 */ "white_florette", "eight_petalled_outlined_black_florette",
  /* 2742 */ "circled_open_centre_eight_pointed_star",
  /* 2743 */ "heavy_teardrop_spoked_pinwheel_asterisk", "snowflake",
  /* 2745 */ "tight_trifoliate_snowflake", "heavy_chevron_snowflake",
  /* 2747 */ "sparkle", "heavy_sparkle", "balloon_spoked_asterisk",
  /* 274A */ "eight_teardrop_spoked_propeller_asterisk",
  /* 274B */ "heavy_eight_teardrop_spoked_propeller_asterisk", "x",
  /* 274D */ "shadowed_white_circle", "negative_squared_cross_mark",
  /* 274F */ "lower_right_drop_shadowed_white_square",
  /* 2750 */ "upper_right_drop_shadowed_white_square",
  /* 2751 */ "lower_right_shadowed_white_square",
  /* 2752 */ "upper_right_shadowed_white_square", "?",
  /* 2754 */ "white_question_mark_ornament", "white_exclamation_mark_ornament",
  /* 2756 */ "black_diamond_minus_white_x", "!", "light_vertical_bar",
  /* 2759 */ "medium_vertical_bar", "heavy_vertical_bar",
  /* 275B */ "heavy_single_turned_comma_quotation_mark_ornament",
  /* 275C */ "heavy_single_comma_quotation_mark_ornament",
  /* 275D */ "heavy_double_turned_comma_quotation_mark_ornament",
  /* 275E */ "heavy_double_comma_quotation_mark_ornament",
  /* 275F */ "heavy_low_single_comma_quotation_mark_ornament",
  /* 2760 */ "heavy_low_double_comma_quotation_mark_ornament",
  /* 2761 */ "curved_stem_paragraph_sign_ornament",
  /* 2762 */ "heavy_exclamation_mark_ornament",
  /* 2763 */ "heavy_heart_exclamation_mark_ornament", "heart",
  /* 2765 */ "rotated_heavy_black_heart_bullet", "floral_heart",
  /* 2767 */ "rotated_floral_heart_bullet", "medium_left_parenthesis_ornament",
  /* 2769 */ "medium_right_parenthesis_ornament",
  /* 276A */ "medium_flattened_left_parenthesis_ornament",
  /* 276B */ "medium_flattened_right_parenthesis_ornament",
  /* 276C */ "medium_left_pointing_angle_bracket_ornament",
  /* 276D */ "medium_right_pointing_angle_bracket_ornament",
  /* 276E */ "heavy_left_pointing_angle_quotation_mark_ornament",
  /* 276F */ "heavy_right_pointing_angle_quotation_mark_ornament",
  /* 2770 */ "heavy_left_pointing_angle_bracket_ornament",
  /* 2771 */ "heavy_right_pointing_angle_bracket_ornament",
  /* 2772 */ "light_left_tortoise_shell_bracket_ornament",
  /* 2773 */ "light_right_tortoise_shell_bracket_ornament",
  /* 2774 */ "medium_left_curly_bracket_ornament",
  /* 2775 */ "medium_right_curly_bracket_ornament", "1", "2", "3", "4", "5",
  /* 277B */ "6", "7", "8", "9", "10", "1", "2", "3", "4", "5", "6", "7", "8",
  /* 2788 */ "9", "10", "1", "2", "3", "4", "5", "6", "7", "8", "9", "10",
  /* 2794 */ "heavy_wide_headed_rightwards_arrow", "heavy_plus_sign",
  /* 2796 */ "heavy_minus_sign", "heavy_division_sign",
  /* 2798 */ "heavy_south_east_arrow", "heavy_rightwards_arrow",
  /* 279A */ "heavy_north_east_arrow", "drafting_point_rightwards_arrow",
  /* 279C */ "heavy_round_tipped_rightwards_arrow",
  /* 279D */ "triangle_headed_rightwards_arrow",
  /* 279E */ "heavy_triangle_headed_rightwards_arrow",
  /* 279F */ "dashed_triangle_headed_rightwards_arrow",
  /* 27A0 */ "heavy_dashed_triangle_headed_rightwards_arrow", "->",
  /* 27A2 */ "three_d_top_lighted_rightwards_arrowhead",
  /* 27A3 */ "three_d_bottom_lighted_rightwards_arrowhead",
  /* 27A4 */ "black_rightwards_arrowhead",
  /* 27A5 */ "heavy_black_curved_downwards_and_rightwards_arrow",
  /* 27A6 */ "heavy_black_curved_upwards_and_rightwards_arrow",
  /* 27A7 */ "squat_black_rightwards_arrow",
  /* 27A8 */ "heavy_concave_pointed_black_rightwards_arrow",
  /* 27A9 */ "right_shaded_white_rightwards_arrow",
  /* 27AA */ "left_shaded_white_rightwards_arrow",
  /* 27AB */ "back_tilted_shadowed_white_rightwards_arrow",
  /* 27AC */ "front_tilted_shadowed_white_rightwards_arrow",
  /* 27AD */ "heavy_lower_right_shadowed_white_rightwards_arrow",
  /* 27AE */ "heavy_upper_right_shadowed_white_rightwards_arrow",
  /* 27AF */ "notched_lower_right_shadowed_white_rightwards_arrow",
  /* 27B0 */ "curly_loop",
  /* 27B1 */ "notched_upper_right_shadowed_white_rightwards_arrow",
  /* 27B2 */ "circled_heavy_white_rightwards_arrow",
  /* 27B3 */ "white_feathered_rightwards_arrow",
  /* 27B4 */ "black_feathered_south_east_arrow",
  /* 27B5 */ "black_feathered_rightwards_arrow",
  /* 27B6 */ "black_feathered_north_east_arrow",
  /* 27B7 */ "heavy_black_feathered_south_east_arrow",
  /* 27B8 */ "heavy_black_feathered_rightwards_arrow",
  /* 27B9 */ "heavy_black_feathered_north_east_arrow",
  /* 27BA */ "teardrop_barbed_rightwards_arrow",
  /* 27BB */ "heavy_teardrop_shanked_rightwards_arrow",
  /* 27BC */ "wedge_tailed_rightwards_arrow",
  /* 27BD */ "heavy_wedge_tailed_rightwards_arrow",
  /* 27BE */ "open_outlined_rightwards_arrow", "double_curly_loop",
};
static_assert(std::size(misc_symbols) == 0x1C0);

// Miscellaneous Symbols and Pictographs, Emoticons
constexpr std::string_view pictographs[] = {
  /* 1F300 */ "cyclone", "foggy", "closed_umbrella", "night_with_stars",
  /* 1F304 */ "sunrise_over_mountains", "sunrise", "cityscape_at_dusk",
  /* 1F307 */ "sunset_over_buildings", "rainbow", "bridge_at_night",
  /* 1F30A */ "water_wave", "volcano", "milky_way", "earth",
  /* 1F30E */ "earth_globe_americas", "earth_globe_asia_australia",
  /* 1F310 */ "globe_with_meridians", "new_moon_symbol",
  /* 1F312 */ "waxing_crescent_moon_symbol", "first_quarter_moon_symbol",
  /* 1F314 */ "waxing_gibbous_moon_symbol", "full_moon_symbol",
  /* 1F316 */ "waning_gibbous_moon_symbol", "last_quarter_moon_symbol",
  /* 1F318 */ "waning_crescent_moon_symbol", "moon", "new_moon_with_face",
  /* 1F31B */ "first_quarter_moon_with_face", "last_quarter_moon_with_face",
  /* 1F31D */ "full_moon_with_face", "sun_with_face", "star", "shooting_star",
  /* 1F321 */ "thermometer", "black_droplet", "white_sun",
  /* 1F324 */ "white_sun_with_small_cloud", "white_sun_behind_cloud",
  /* 1F326 */ "white_sun_behind_cloud_with_rain", "cloud_with_rain",
  /* 1F328 */ "cloud_with_snow", "cloud_with_lightning", "cloud_with_tornado",
  /* 1F32B */ "fog", "wind_blowing_face", "hot_dog", "taco", "burrito",
  /* 1F330 */ "chestnut", "seedling", "tree", "deciduous_tree", "palm_tree",
  /* 1F335 */ "cactus", "hot_pepper", "tulip", "blossom", "rose", "hibiscus",
  /* 1F33B */ "sunflower", "blossom", "ear_of_maize", "ear_of_rice", "herb",
  /* 1F340 */ "clover", "maple_leaf", "fallen_leaf", "leaf_fluttering_in_wind",
  /* 1F344 */ "mushroom", "tomato", "aubergine", "grapes", "melon",
  /* 1F349 */ "watermelon", "tangerine", "lemon", "banana", "pineapple",
  /* 1F34E */ "apple", "green_apple", "pear", "peach", "cherries",
  /* 1F353 */ "strawberry", "hamburger", "pizza", "meat_on_bone",
  /* 1F357 */ "poultry_leg", "rice_cracker", "rice_ball", "cooked_rice",
  /* 1F35B */ "curry_and_rice", "steaming_bowl", "spaghetti", "bread",
  /* 1F35F */ "french_fries", "roasted_sweet_potato", "dango", "oden", "sushi",
  /* 1F364 */ "fried_shrimp", "fish_cake_with_swirl_design", "soft_ice_cream",
  /* 1F367 */ "shaved_ice", "ice_cream", "doughnut", "cookie", "chocolate_bar",
  /* 1F36C */ "candy", "lollipop", "custard", "honey_pot", "shortcake",
  /* 1F371 */ "bento_box", "pot_of_food", "cooking", "fork_and_knife",
  /* 1F375 */ "teacup_without_handle", "sake_bottle_and_cup", "wine_glass",
  /* 1F378 */ "cocktail_glass", "tropical_drink", "beer", "clinking_beer_mugs",
  /* 1F37C */ "baby_bottle", "fork_and_knife_with_plate",
  /* 1F37E */ "bottle_with_popping_cork", "popcorn", "ribbon", "gift", "cake",
  /* 1F383 */ "jack_o_lantern", "christmas_tree", "father_christmas",
  /* 1F386 */ "fireworks", "firework_sparkler", "balloon", "tada",
  /* 1F38A */ "confetti_ball", "tanabata_tree", "crossed_flags",
  /* 1F38D */ "pine_decoration", "japanese_dolls", "carp_streamer",
  /* 1F390 */ "wind_chime", "moon_viewing_ceremony", "school_satchel",
  /* 1F393 */ "graduation_cap", "heart_with_tip_on_the_left",
  /* 1F395 */ "bouquet_of_flowers", "military_medal", "reminder_ribbon",
  /* 1F398 */ "musical_keyboard_with_jacks", "studio_microphone",
  /* 1F39A */ "level_slider", "control_knobs",
  /* 1F39C */ "beamed_ascending_musical_notes",
  /* 1F39D */ "beamed_descending_musical_notes", "film_frames",
  /* 1F39F */ "admission_tickets", "carousel_horse", "ferris_wheel",
  /* 1F3A2 */ "roller_coaster", "fishing_pole_and_fish", "microphone",
  /* 1F3A5 */ "movie_camera", "cinema", "headphone", "artist_palette",
  /* 1F3A9 */ "top_hat", "circus_tent", "ticket", "clapper_board",
  /* 1F3AD */ "performing_arts", "video_game", "direct_hit", "slot_machine",
  /* 1F3B1 */ "billiards", "game_die", "bowling", "flower_playing_cards",
  /* 1F3B5 */ "music", "multiple_musical_notes", "saxophone", "guitar",
  /* 1F3B9 */ "musical_keyboard", "trumpet", "violin", "musical_score",
  /* 1F3BD */ "running_shirt_with_sash", "tennis_racquet_and_ball",
  /* 1F3BF */ "ski_and_ski_boot", "basketball_and_hoop", "chequered_flag",
  /* 1F3C2 */ "snowboarder", "runner", "surfer", "sports_medal", "trophy",
  /* 1F3C7 */ "horse_racing", "american_football", "rugby_football", "swimmer",
  /* 1F3CB */ "weight_lifter", "golfer", "racing_motorcycle", "racing_car",
  /* 1F3CF */ "cricket_bat_and_ball", "volleyball",
  /* 1F3D1 */ "field_hockey_stick_and_ball", "ice_hockey_stick_and_puck",
  /* 1F3D3 */ "table_tennis_paddle_and_ball", "snow_capped_mountain",
  /* 1F3D5 */ "camping", "beach_with_umbrella", "building_construction",
  /* 1F3D8 */ "house_buildings", "cityscape", "derelict_house_building",
  /* 1F3DB */ "classical_building", "desert", "desert_island", "national_park",
  /* 1F3DF */ "stadium", "house", "house_with_garden", "office_building",
  /* 1F3E3 */ "japanese_post_office", "european_post_office", "hospital",
  /* 1F3E6 */ "bank", "automated_teller_machine", "hotel", "love_hotel",
  /* 1F3EA */ "convenience_store", "school", "department_store", "factory",
  /* 1F3EE */ "izakaya_lantern", "japanese_castle", "european_castle",
  /* 1F3F1 */ "white_pennant", "black_pennant", "waving_white_flag",
  /* 1F3F4 */ "waving_black_flag", "rosette", "black_rosette", "label",
  /* 1F3F8 */ "badminton_racquet_and_shuttlecock", "bow_and_arrow", "amphora",
  /* 1F3FB */ "light_skin_tone", "medium_light_skin_tone", "medium_skin_tone",
  /* 1F3FE */ "medium_dark_skin_tone", "dark_skin_tone", "rat", "mouse", "ox",
  /* 1F403 */ "water_buffalo", "cow", "tiger", "leopard", "rabbit", "cat",
  /* 1F409 */ "dragon", "crocodile", "whale", "snail", "snake", "horse", "ram",
  /* 1F410 */ "goat", "sheep", "monkey", "rooster", "chicken", "dog", "pig",
  /* 1F417 */ "boar", "elephant", "octopus", "spiral_shell", "bug", "ant",
  /* 1F41D */ "honeybee", "lady_beetle", "fish", "tropical_fish", "blowfish",
  /* 1F422 */ "turtle", "hatching_chick", "baby_chick",
  /* 1F425 */ "front_facing_baby_chick", "bird", "penguin", "koala", "poodle",
  /* 1F42A */ "dromedary_camel", "bactrian_camel", "dolphin", "mouse_face",
  /* 1F42E */ "cow_face", "tiger_face", "rabbit_face", "cat", "dragon_face",
  /* 1F433 */ "spouting_whale", "horse_face", "monkey_face", "dog", "pig_face",
  /* 1F438 */ "frog_face", "hamster_face", "wolf_face", "bear_face",
  /* 1F43C */ "panda_face", "pig_nose", "paw_prints", "chipmunk", "eyes",
  /* 1F441 */ "eye", "ear", "nose", "mouth", "tongue",
  /* 1F446 */ "white_up_pointing_backhand_index",
  /* 1F447 */ "white_down_pointing_backhand_index",
  /* 1F448 */ "white_left_pointing_backhand_index",
  /* 1F449 */ "white_right_pointing_backhand_index", "fisted_hand_sign",
  /* 1F44B */ "wave", "ok_hand", "thumbsup", "thumbsdown", "clap",
  /* 1F450 */ "open_hands_sign", "crown", "womans_hat", "eyeglasses",
  /* 1F454 */ "necktie", "t_shirt", "jeans", "dress", "kimono", "bikini",
  /* 1F45A */ "womans_clothes", "purse", "handbag", "pouch", "mans_shoe",
  /* 1F45F */ "athletic_shoe", "high_heeled_shoe", "womans_sandal",
  /* 1F462 */ "womans_boots", "footprints", "person", "busts_in_silhouette",
  /* 1F466 */ "boy", "girl", "man", "woman", "family",
  /* 1F46B */ "man_and_woman_holding_hands", "two_men_holding_hands",
  /* 1F46D */ "two_women_holding_hands", "police_officer",
  /* 1F46F */ "woman_with_bunny_ears", "bride_with_veil",
  /* 1F471 */ "person_with_blond_hair", "man_with_gua_pi_mao",
  /* 1F473 */ "man_with_turban", "older_man", "older_woman", "baby",
  /* 1F477 */ "construction_worker", "princess", "japanese_ogre",
  /* 1F47A */ "japanese_goblin", "ghost", "baby_angel",
  /* 1F47D */ "extraterrestrial_alien", "alien_monster", "imp", "skull",
  /* 1F481 */ "information_desk_person", "guardsman", "dancer", "lipstick",
  /* 1F485 */ "nail_polish", "face_massage", "haircut", "barber_pole",
  /* 1F489 */ "syringe", "pill", "kiss_mark", "love_letter", "ring",
  /* 1F48E */ "gem_stone", "kiss", "bouquet", "couple_with_heart", "wedding",
  /* 1F493 */ "beating_heart", "broken_heart", "two_hearts", "sparkling_heart",
  /* 1F497 */ "growing_heart", "heart_with_arrow", "blue_heart", "green_heart",
  /* 1F49B */ "yellow_heart", "purple_heart", "heart_with_ribbon",
  /* 1F49E */ "revolving_hearts", "heart_decoration",
  /* 1F4A0 */ "diamond_shape_with_a_dot_inside", "bulb", "anger_symbol",
  /* 1F4A3 */ "bomb", "sleeping_symbol", "collision_symbol",
  /* 1F4A6 */ "splashing_sweat_symbol", "droplet", "dash_symbol", "poop",
  /* 1F4AA */ "flexed_biceps", "dizzy_symbol", "speech_balloon",
  /* 1F4AD */ "thought_balloon", "white_flower", "100", "money_bag",
  /* 1F4B1 */ "currency_exchange", "heavy_dollar_sign", "credit_card",
  /* 1F4B4 */ "banknote_with_yen_sign", "banknote_with_dollar_sign",
  /* 1F4B6 */ "banknote_with_euro_sign", "banknote_with_pound_sign",
  /* 1F4B8 */ "money_with_wings", "chart_with_upwards_trend_and_yen_sign",
  /* 1F4BA */ "seat", "computer", "briefcase", "minidisc", "floppy_disk",
  /* 1F4BF */ "optical_disc", "dvd", "folder", "open_file_folder",
  /* 1F4C3 */ "page_with_curl", "page", "calendar", "tear_off_calendar",
  /* 1F4C7 */ "card_index", "chart_with_upwards_trend",
  /* 1F4C9 */ "chart_with_downwards_trend", "bar_chart", "clipboard",
  /* 1F4CC */ "pushpin", "round_pushpin", "paperclip", "straight_ruler",
  /* 1F4D0 */ "triangular_ruler", "bookmark_tabs", "ledger", "notebook",
  /* 1F4D4 */ "notebook_with_decorative_cover", "closed_book", "open_book",
  /* 1F4D7 */ "green_book", "blue_book", "orange_book", "books", "name_badge",
  /* 1F4DC */ "scroll", "memo", "telephone_receiver", "pager", "fax_machine",
  /* 1F4E1 */ "satellite_antenna", "public_address_loudspeaker",
  /* 1F4E3 */ "cheering_megaphone", "outbox_tray", "inbox_tray", "package",
  /* 1F4E7 */ "email", "incoming_envelope",
  /* 1F4E9 */ "envelope_with_downwards_arrow_above",
  /* 1F4EA */ "closed_mailbox_with_lowered_flag",
  /* 1F4EB */ "closed_mailbox_with_raised_flag",
  /* 1F4EC */ "open_mailbox_with_raised_flag",
  /* 1F4ED */ "open_mailbox_with_lowered_flag", "postbox", "postal_horn",
  /* 1F4F0 */ "newspaper", "phone",
  /* 1F4F2 */ "mobile_phone_with_rightwards_arrow_at_left", "vibration_mode",
  /* 1F4F4 */ "mobile_phone_off", "no_mobile_phones", "antenna_with_bars",
  /* 1F4F7 */ "camera", "camera_with_flash", "video_camera", "television",
  /* 1F4FB */ "radio", "videocassette", "film_projector", "portable_stereo",
  /* 1F4FF */ "prayer_beads", "twisted_rightwards_arrows",
  /* 1F501 */ "clockwise_rightwards_and_leftwards_open_circle_arrows",
  /* 1F502 */ "repeat_one",
  /* 1F503 */ "clockwise_downwards_and_upwards_open_circle_arrows",
  /* 1F504 */ "anticlockwise_downwards_and_upwards_open_circle_arrows",
  /* 1F505 */ "low_brightness_symbol", "high_brightness_symbol",
  /* 1F507 */ "speaker_with_cancellation_stroke", "speaker",
  /* 1F509 */ "speaker_with_one_sound_wave", "speaker_with_three_sound_waves",
  /* 1F50B */ "battery", "electric_plug", "search",
  /* 1F50E */ "right_pointing_magnifying_glass", "lock_with_ink_pen",
  /* 1F510 */ "closed_lock_with_key", "key", "lock", "open_lock", "bell",
  /* 1F515 */ "bell_with_cancellation_stroke", "bookmark", "link_symbol",
  /* 1F518 */ "radio_button", "back_with_leftwards_arrow_above",
  /* 1F51A */ "end_with_leftwards_arrow_above",
  /* 1F51B */ "on_with_exclamation_mark_with_left_right_arrow_above",
  /* 1F51C */ "soon_with_rightwards_arrow_above",
  /* 1F51D */ "top_with_upwards_arrow_above", "no_one_under_eighteen_symbol",
  /* 1F51F */ "keycap_ten", "input_symbol_for_latin_capital_letters",
  /* 1F521 */ "input_symbol_for_latin_small_letters",
  /* 1F522 */ "input_symbol_for_numbers", "input_symbol_for_symbols",
  /* 1F524 */ "input_symbol_for_latin_letters", "fire", "electric_torch",
  /* 1F527 */ "wrench", "hammer", "nut_and_bolt", "hocho", "pistol",
  /* 1F52C */ "microscope", "telescope", "crystal_ball",
  /* 1F52F */ "six_pointed_star_with_middle_dot",
  /* 1F530 */ "japanese_symbol_for_beginner", "trident_emblem",
  /* 1F532 */ "black_square_button", "white_square_button", "large_red_circle",
  /* 1F535 */ "large_blue_circle", "large_orange_diamond",
  /* 1F537 */ "large_blue_diamond", "small_orange_diamond",
  /* 1F539 */ "small_blue_diamond", "up_pointing_red_triangle",
  /* 1F53B */ "down_pointing_red_triangle", "up_pointing_small_red_triangle",
  /* 1F53D */ "down_pointing_small_red_triangle",
  /* 1F53E */ "lower_right_shadowed_white_circle",
  /* 1F53F */ "upper_right_shadowed_white_circle", "circled_cross_pommee",
  /* 1F541 */ "cross_pommee_with_half_circle_below", "cross_pommee",
  /* 1F543 */ "notched_left_semicircle_with_three_dots",
  /* 1F544 */ "notched_right_semicircle_with_three_dots",
  /* 1F545 */ "symbol_for_marks_chapter", "white_latin_cross",
  /* 1F547 */ "heavy_latin_cross", "celtic_cross", "om_symbol",
  /* 1F54A */ "dove_of_peace", "kaaba", "mosque", "synagogue",
  /* 1F54E */ "menorah_with_nine_branches", "bowl_of_hygieia",
  /* 1F550 */ "clock_face_one_oclock", "clock_face_two_oclock",
  /* 1F552 */ "clock_face_three_oclock", "clock_face_four_oclock",
  /* 1F554 */ "clock_face_five_oclock", "clock_face_six_oclock",
  /* 1F556 */ "clock_face_seven_oclock", "clock_face_eight_oclock",
  /* 1F558 */ "clock_face_nine_oclock", "clock_face_ten_oclock",
  /* 1F55A */ "clock_face_eleven_oclock", "clock_face_twelve_oclock",
  /* 1F55C */ "clock_face_one_thirty", "clock_face_two_thirty",
  /* 1F55E */ "clock_face_three_thirty", "clock_face_four_thirty",
  /* 1F560 */ "clock_face_five_thirty", "clock_face_six_thirty",
  /* 1F562 */ "clock_face_seven_thirty", "clock_face_eight_thirty",
  /* 1F564 */ "clock_face_nine_thirty", "clock_face_ten_thirty",
  /* 1F566 */ "clock_face_eleven_thirty", "clock_face_twelve_thirty",
  /* 1F568 */ "right_speaker", "right_speaker_with_one_sound_wave",
  /* 1F56A */ "right_speaker_with_three_sound_waves", "bullhorn",
  /* 1F56C */ "bullhorn_with_sound_waves", "ringing_bell", "book", "candle",
  /* 1F570 */ "mantelpiece_clock", "black_skull_and_crossbones", "no_piracy",
  /* 1F573 */ "hole", "man_in_business_suit_levitating", "sleuth_or_spy",
  /* 1F576 */ "dark_sunglasses", "spider", "spider_web", "joystick",
  /* 1F57A */ "man_dancing", "left_hand_telephone_receiver",
  /* 1F57C */ "telephone_receiver_with_page", "right_hand_telephone_receiver",
  /* 1F57E */ "white_touchtone_telephone", "black_touchtone_telephone",
  /* 1F580 */ "telephone_on_top_of_modem", "clamshell_mobile_phone",
  /* 1F582 */ "back_of_envelope", "stamped_envelope",
  /* 1F584 */ "envelope_with_lightning", "flying_envelope",
  /* 1F586 */ "pen_over_stamped_envelope", "linked_paperclips",
  /* 1F588 */ "black_pushpin", "lower_left_pencil", "lower_left_ballpoint_pen",
  /* 1F58B */ "lower_left_fountain_pen", "lower_left_paintbrush",
  /* 1F58D */ "lower_left_crayon", "left_writing_hand", "turned_ok_hand_sign",
  /* 1F590 */ "raised_hand_with_fingers_splayed",
  /* 1F591 */ "reversed_raised_hand_with_fingers_splayed",
  /* 1F592 */ "reversed_thumbs_up_sign", "reversed_thumbs_down_sign",
  /* 1F594 */ "reversed_victory_hand",
  /* 1F595 */ "reversed_hand_with_middle_finger_extended",
  /* 1F596 */ "raised_hand_with_part_between_middle_and_ring_fingers",
  /* 1F597 */ "white_down_pointing_left_hand_index",
  /* 1F598 */ "sideways_white_left_pointing_index",
  /* 1F599 */ "sideways_white_right_pointing_index",
  /* 1F59A */ "sideways_black_left_pointing_index",
  /* 1F59B */ "sideways_black_right_pointing_index",
  /* 1F59C */ "black_left_pointing_backhand_index",
  /* 1F59D */ "black_right_pointing_backhand_index",
  /* 1F59E */ "sideways_white_up_pointing_index",
  /* 1F59F */ "sideways_white_down_pointing_index",
  /* 1F5A0 */ "sideways_black_up_pointing_index",
  /* 1F5A1 */ "sideways_black_down_pointing_index",
  /* 1F5A2 */ "black_up_pointing_backhand_index",
  /* 1F5A3 */ "black_down_pointing_backhand_index", "black_heart",
  /* 1F5A5 */ "desktop_computer", "keyboard_and_mouse",
  /* 1F5A7 */ "three_networked_computers", "printer", "pocket_calculator",
  /* 1F5AA */ "black_hard_shell_floppy_disk", "white_hard_shell_floppy_disk",
  /* 1F5AC */ "soft_shell_floppy_disk", "tape_cartridge", "wired_keyboard",
  /* 1F5AF */ "one_button_mouse", "two_button_mouse", "three_button_mouse",
  /* 1F5B2 */ "trackball", "old_personal_computer", "hard_disk", "screen",
  /* 1F5B6 */ "printer_icon", "fax_icon", "optical_disc_icon",
  /* 1F5B9 */ "document_with_text", "document_with_text_and_picture",
  /* 1F5BB */ "document_with_picture", "frame_with_picture",
  /* 1F5BD */ "frame_with_tiles", "frame_with_an_x", "black_folder", "folder",
  /* 1F5C1 */ "open_folder", "card_index_dividers", "card_file_box",
  /* 1F5C4 */ "file_cabinet", "empty_note", "empty_note_page",
  /* 1F5C7 */ "empty_note_pad", "note", "note_page", "note_pad",
  /* 1F5CB */ "empty_document", "empty_page", "empty_pages", "document",
  /* 1F5CF */ "page", "pages", "wastebasket", "spiral_note_pad",
  /* 1F5D3 */ "spiral_calendar_pad", "desktop_window", "minimize", "maximize",
  /* 1F5D7 */ "overlap", "clockwise_right_and_left_semicircle_arrows",
  /* 1F5D9 */ "cancellation_x", "increase_font_size_symbol",
  /* 1F5DB */ "decrease_font_size_symbol", "compression", "old_key",
  /* 1F5DE */ "rolled_up_newspaper", "page_with_circled_text", "stock_chart",
  /* 1F5E1 */ "dagger_knife", "lips", "speaking_head_in_silhouette",
  /* 1F5E4 */ "three_rays_above", "three_rays_below", "three_rays_left",
  /* 1F5E7 */ "three_rays_right", "left_speech_bubble", "right_speech_bubble",
  /* 1F5EA */ "two_speech_bubbles", "three_speech_bubbles",
  /* 1F5EC */ "left_thought_bubble", "right_thought_bubble",
  /* 1F5EE */ "left_anger_bubble", "right_anger_bubble", "mood_bubble",
  /* 1F5F1 */ "lightning_mood_bubble", "lightning_mood",
  /* 1F5F3 */ "ballot_box_with_ballot", "ballot_script_x",
  /* 1F5F5 */ "ballot_box_with_script_x", "ballot_bold_script_x",
  /* 1F5F7 */ "ballot_box_with_bold_script_x", "light_check_mark",
  /* 1F5F9 */ "ballot_box_with_bold_check", "world_map", "mount_fuji",
  /* 1F5FC */ "tokyo_tower", "statue_of_liberty", "silhouette_of_japan",
  /* 1F5FF */ "moyai", "grinning", "grin", "joy", "smiley", "smile",
  /* 1F605 */ "sweat_smile", "laughing", "innocent", "smiling_face_with_horns",
  /* 1F609 */ "wink", "blush", "face_savouring_delicious_food",
  /* 1F60C */ "relieved_face", "heart_eyes", "sunglasses", "smirking_face",
  /* 1F610 */ "neutral", "expressionless_face", "unamused",
  /* 1F613 */ "face_with_cold_sweat", "pensive", "confused_face",
  /* 1F616 */ "confounded_face", "kissing_face", "kiss",
  /* 1F619 */ "kissing_face_with_smiling_eyes",
  /* 1F61A */ "kissing_face_with_closed_eyes", "tongue",
  /* 1F61C */ "face_with_stuck_out_tongue_and_winking_eye",
  /* 1F61D */ "face_with_stuck_out_tongue_and_tightly_closed_eyes",
  /* 1F61E */ "disappointed_face", "worried_face", "angry_face",
  /* 1F621 */ "pouting_face", "cry", "persevering_face",
  /* 1F624 */ "face_with_look_of_triumph", "disappointed_but_relieved_face",
  /* 1F626 */ "frowning_face_with_open_mouth", "anguished_face",
  /* 1F628 */ "fearful_face", "weary_face", "sleepy_face", "tired_face",
  /* 1F62C */ "grimacing_face", "sob", "face_with_open_mouth", "hushed_face",
  /* 1F630 */ "face_with_open_mouth_and_cold_sweat", "scream",
  /* 1F632 */ "astonished_face", "flushed", "sleeping_face", "dizzy_face",
  /* 1F636 */ "face_without_mouth", "face_with_medical_mask",
  /* 1F638 */ "grinning_cat_face_with_smiling_eyes",
  /* 1F639 */ "cat_face_with_tears_of_joy", "smiling_cat_face_with_open_mouth",
  /* 1F63B */ "smiling_cat_face_with_heart_shaped_eyes",
  /* 1F63C */ "cat_face_with_wry_smile", "kissing_cat_face_with_closed_eyes",
  /* 1F63E */ "pouting_cat_face", "crying_cat_face", "weary_cat_face",
  /* 1F641 */ "slightly_frowning_face", "slight_smile", "upside_down",
  /* 1F644 */ "eye_roll", "face_with_no_good_gesture", "face_with_ok_gesture",
  /* 1F647 */ "person_bowing_deeply", "see_no_evil", "hear_no_evil_monkey",
  /* 1F64A */ "speak_no_evil_monkey", "happy_person_raising_one_hand",
  /* 1F64C */ "person_raising_both_hands_in_celebration", "person_frowning",
  /* 1F64E */ "person_with_pouting_face", "pray",
};
static_assert(std::size(pictographs) == 0x350);

// Transport and Map Symbols
constexpr std::string_view transport[] = {
  /* 1F680 */ "rocket", "helicopter", "steam_locomotive", "railway_car",
  /* 1F684 */ "high_speed_train", "high_speed_train_with_bullet_nose", "train",
  /* 1F687 */ "metro", "light_rail", "station", "tram", "tram_car", "bus",
  /* 1F68D */ "oncoming_bus", "trolleybus", "bus_stop", "minibus", "ambulance",
  /* 1F692 */ "fire_engine", "police_car", "oncoming_police_car", "taxi",
  /* 1F696 */ "oncoming_taxi", "car", "oncoming_automobile",
  /* 1F699 */ "recreational_vehicle", "delivery_truck", "articulated_lorry",
  /* 1F69C */ "tractor", "monorail", "mountain_railway", "suspension_railway",
  /* 1F6A0 */ "mountain_cableway", "aerial_tramway", "ship", "rowboat",
  /* 1F6A4 */ "speedboat", "horizontal_traffic_light",
  /* 1F6A6 */ "vertical_traffic_light", "construction_sign", "siren",
  /* 1F6A9 */ "triangular_flag_on_post", "door", "no_entry_sign",
  /* 1F6AC */ "smoking_symbol", "no_smoking_symbol",
  /* 1F6AE */ "put_litter_in_its_place_symbol", "do_not_litter_symbol",
  /* 1F6B0 */ "potable_water_symbol", "non_potable_water_symbol", "bicycle",
  /* 1F6B3 */ "no_bicycles", "bicyclist", "mountain_bicyclist", "pedestrian",
  /* 1F6B7 */ "no_pedestrians", "children_crossing", "mens_symbol",
  /* 1F6BA */ "womens_symbol", "restroom", "baby_symbol", "toilet",
  /* 1F6BE */ "water_closet", "shower", "bath", "bathtub", "passport_control",
  /* 1F6C3 */ "customs", "baggage_claim", "left_luggage",
  /* 1F6C6 */ "triangle_with_rounded_corners", "prohibited_sign",
  /* 1F6C8 */ "circled_information_source", "boys_symbol", "girls_symbol",
  /* 1F6CB */ "couch_and_lamp", "sleeping_accommodation", "shopping_bags",
  /* 1F6CE */ "bellhop_bell", "bed", "place_of_worship", "octagonal_sign",
  /* 1F6D2 */ "shopping_trolley", "stupa", "pagoda", "hindu_temple", "hut",
  /* 1F6D7 */ "elevator", "", "", "", "", "wireless", "playground_slide",
  /* 1F6DE */ "wheel", "ring_buoy", "hammer_and_wrench", "shield", "oil_drum",
  /* 1F6E3 */ "motorway", "railway_track", "motor_boat",
  /* 1F6E6 */ "up_pointing_military_airplane", "up_pointing_airplane",
  /* 1F6E8 */ "up_pointing_small_airplane", "small_airplane",
  /* 1F6EA */ "northeast_pointing_airplane", "airplane_departure",
  /* 1F6EC */ "airplane_arriving", "", "", "", "satellite",
  /* 1F6F1 */ "oncoming_fire_engine", "diesel_locomotive", "passenger_ship",
  /* 1F6F4 */ "scooter", "motor_scooter", "canoe", "sled", "flying_saucer",
  /* 1F6F9 */ "skateboard", "auto_rickshaw", "pickup_truck", "roller_skate",
  /* 1F6FD */ "", "", "",
};
static_assert(std::size(transport) == 0x80);

// Supplemental Symbols and Pictographs, Chess, Extended-A
constexpr std::string_view supplemental[] = {
  /* 1F900 */ "circled_cross_formee_with_four_dots",
  /* 1F901 */ "circled_cross_formee_with_two_dots", "circled_cross_formee",
  /* 1F903 */ "left_half_circle_with_four_dots",
  /* 1F904 */ "left_half_circle_with_three_dots",
  /* 1F905 */ "left_half_circle_with_two_dots", "left_half_circle_with_dot",
  /* 1F907 */ "left_half_circle", "downward_facing_hook",
  /* 1F909 */ "downward_facing_notched_hook", "downward_facing_hook_with_dot",
  /* 1F90B */ "downward_facing_notched_hook_with_dot", "pinched_fingers",
  /* 1F90D */ "white_heart", "brown_heart", "pinching_hand",
  /* 1F910 */ "zipper_mouth_face", "money_mouth_face", "face_with_thermometer",
  /* 1F913 */ "nerd_face", "thinking", "face_with_head_bandage", "robot_face",
  /* 1F917 */ "hugging_face", "sign_of_the_horns", "call_me_hand",
  /* 1F91A */ "raised_back_of_hand", "left_facing_fist", "right_facing_fist",
  /* 1F91D */ "handshake", "hand_with_index_and_middle_fingers_crossed",
  /* 1F91F */ "i_love_you_hand_sign", "face_with_cowboy_hat", "clown_face",
  /* 1F922 */ "nauseated_face", "rofl", "drooling_face", "lying_face",
  /* 1F926 */ "face_palm", "sneezing_face", "face_with_one_eyebrow_raised",
  /* 1F929 */ "star_struck", "grinning_face_with_one_large_and_one_small_eye",
  /* 1F92B */ "face_with_finger_covering_closed_lips",
  /* 1F92C */ "serious_face_with_symbols_covering_mouth",
  /* 1F92D */ "smiling_face_with_smiling_eyes_and_hand_covering_mouth",
  /* 1F92E */ "face_with_open_mouth_vomiting",
  /* 1F92F */ "shocked_face_with_exploding_head", "pregnant_woman",
  /* 1F931 */ "breast_feeding", "palms_up_together", "selfie", "prince",
  /* 1F935 */ "man_in_tuxedo", "mother_christmas", "shrug",
  /* 1F938 */ "person_doing_cartwheel", "juggling", "fencer",
  /* 1F93B */ "modern_pentathlon", "wrestlers", "water_polo", "handball",
  /* 1F93F */ "diving_mask", "wilted_flower", "drum_with_drumsticks",
  /* 1F942 */ "clinking_glasses", "tumbler_glass", "spoon", "goal_net",
  /* 1F946 */ "rifle", "first_place_medal", "second_place_medal",
  /* 1F949 */ "third_place_medal", "boxing_glove", "martial_arts_uniform",
  /* 1F94C */ "curling_stone", "lacrosse_stick_and_ball", "softball",
  /* 1F94F */ "flying_disc", "croissant", "avocado", "cucumber", "bacon",
  /* 1F954 */ "potato", "carrot", "baguette_bread", "green_salad",
  /* 1F958 */ "shallow_pan_of_food", "stuffed_flatbread", "egg",
  /* 1F95B */ "glass_of_milk", "peanuts", "kiwifruit", "pancakes", "dumpling",
  /* 1F960 */ "fortune_cookie", "takeout_box", "chopsticks", "bowl_with_spoon",
  /* 1F964 */ "cup_with_straw", "coconut", "broccoli", "pie", "pretzel",
  /* 1F969 */ "cut_of_meat", "sandwich", "canned_food", "leafy_green", "mango",
  /* 1F96E */ "moon_cake", "bagel", "smiling_hearts", "yawning_face",
  /* 1F972 */ "smiling_face_with_tear", "face_with_party_horn_and_party_hat",
  /* 1F974 */ "face_with_uneven_eyes_and_wavy_mouth", "overheated_face",
  /* 1F976 */ "freezing_face", "ninja", "disguised_face",
  /* 1F979 */ "face_holding_back_tears", "face_with_pleading_eyes", "sari",
  /* 1F97C */ "lab_coat", "goggles", "hiking_boot", "flat_shoe", "crab",
  /* 1F981 */ "lion_face", "scorpion", "turkey", "unicorn_face", "eagle",
  /* 1F986 */ "duck", "bat", "shark", "owl", "fox_face", "butterfly", "deer",
  /* 1F98D */ "gorilla", "lizard", "rhinoceros", "shrimp", "squid",
  /* 1F992 */ "giraffe_face", "zebra_face", "hedgehog", "sauropod", "t_rex",
  /* 1F997 */ "cricket", "kangaroo", "llama", "peacock", "hippopotamus",
  /* 1F99C */ "parrot", "raccoon", "lobster", "mosquito", "microbe", "badger",
  /* 1F9A2 */ "swan", "mammoth", "dodo", "sloth", "otter", "orangutan",
  /* 1F9A8 */ "skunk", "flamingo", "oyster", "beaver", "bison", "seal",
  /* 1F9AE */ "guide_dog", "probing_cane", "emoji_component_red_hair",
  /* 1F9B1 */ "emoji_component_curly_hair", "emoji_component_bald",
  /* 1F9B3 */ "emoji_component_white_hair", "bone", "leg", "foot", "tooth",
  /* 1F9B8 */ "superhero", "supervillain", "safety_vest",
  /* 1F9BB */ "ear_with_hearing_aid", "motorized_wheelchair",
  /* 1F9BD */ "manual_wheelchair", "mechanical_arm", "mechanical_leg",
  /* 1F9C0 */ "cheese_wedge", "cupcake", "salt_shaker", "beverage_box",
  /* 1F9C4 */ "garlic", "onion", "falafel", "waffle", "butter", "mate_drink",
  /* 1F9CA */ "ice_cube", "bubble_tea", "troll", "standing_person",
  /* 1F9CE */ "kneeling_person", "deaf_person", "face_with_monocle", "adult",
  /* 1F9D2 */ "child", "older_adult", "bearded_person",
  /* 1F9D5 */ "person_with_headscarf", "person_in_steamy_room",
  /* 1F9D7 */ "person_climbing", "person_in_lotus_position", "mage", "fairy",
  /* 1F9DB */ "vampire", "merperson", "elf", "genie", "zombie", "brain",
  /* 1F9E1 */ "orange_heart", "billed_cap", "scarf", "gloves", "coat", "socks",
  /* 1F9E7 */ "red_gift_envelope", "firecracker", "jigsaw_puzzle_piece",
  /* 1F9EA */ "test_tube", "petri_dish", "dna_double_helix", "compass",
  /* 1F9EE */ "abacus", "fire_extinguisher", "toolbox", "brick", "magnet",
  /* 1F9F3 */ "luggage", "lotion_bottle", "spool_of_thread", "ball_of_yarn",
  /* 1F9F7 */ "safety_pin", "teddy_bear", "broom", "basket", "roll_of_paper",
  /* 1F9FC */ "bar_of_soap", "sponge", "receipt", "nazar_amulet",
  /* 1FA00 */ "neutral_chess_king", "neutral_chess_queen",
  /* 1FA02 */ "neutral_chess_rook", "neutral_chess_bishop",
  /* 1FA04 */ "neutral_chess_knight", "neutral_chess_pawn",
  /* 1FA06 */ "white_chess_knight_rotated_forty_five_degrees",
  /* 1FA07 */ "black_chess_knight_rotated_forty_five_degrees",
  /* 1FA08 */ "neutral_chess_knight_rotated_forty_five_degrees",
  /* 1FA09 */ "white_chess_king_rotated_ninety_degrees",
  /* 1FA0A */ "white_chess_queen_rotated_ninety_degrees",
  /* 1FA0B */ "white_chess_rook_rotated_ninety_degrees",
  /* 1FA0C */ "white_chess_bishop_rotated_ninety_degrees",
  /* 1FA0D */ "white_chess_knight_rotated_ninety_degrees",
  /* 1FA0E */ "white_chess_pawn_rotated_ninety_degrees",
  /* 1FA0F */ "black_chess_king_rotated_ninety_degrees",
  /* 1FA10 */ "black_chess_queen_rotated_ninety_degrees",
  /* 1FA11 */ "black_chess_rook_rotated_ninety_degrees",
  /* 1FA12 */ "black_chess_bishop_rotated_ninety_degrees",
  /* 1FA13 */ "black_chess_knight_rotated_ninety_degrees",
  /* 1FA14 */ "black_chess_pawn_rotated_ninety_degrees",
  /* 1FA15 */ "neutral_chess_king_rotated_ninety_degrees",
  /* 1FA16 */ "neutral_chess_queen_rotated_ninety_degrees",
  /* 1FA17 */ "neutral_chess_rook_rotated_ninety_degrees",
  /* 1FA18 */ "neutral_chess_bishop_rotated_ninety_degrees",
  /* 1FA19 */ "neutral_chess_knight_rotated_ninety_degrees",
  /* 1FA1A */ "neutral_chess_pawn_rotated_ninety_degrees",
  /* 1FA1B */ "white_chess_knight_rotated_one_hundred_thirty_five_degrees",
  /* 1FA1C */ "black_chess_knight_rotated_one_hundred_thirty_five_degrees",
  /* 1FA1D */ "neutral_chess_knight_rotated_one_hundred_thirty_five_degrees",
  /* 1FA1E */ "white_chess_turned_king", "white_chess_turned_queen",
  /* 1FA20 */ "white_chess_turned_rook", "white_chess_turned_bishop",
  /* 1FA22 */ "white_chess_turned_knight", "white_chess_turned_pawn",
  /* 1FA24 */ "black_chess_turned_king", "black_chess_turned_queen",
  /* 1FA26 */ "black_chess_turned_rook", "black_chess_turned_bishop",
  /* 1FA28 */ "black_chess_turned_knight", "black_chess_turned_pawn",
  /* 1FA2A */ "neutral_chess_turned_king", "neutral_chess_turned_queen",
  /* 1FA2C */ "neutral_chess_turned_rook", "neutral_chess_turned_bishop",
  /* 1FA2E */ "neutral_chess_turned_knight", "neutral_chess_turned_pawn",
  /* 1FA30 */ "white_chess_knight_rotated_two_hundred_twenty_five_degrees",
  /* 1FA31 */ "black_chess_knight_rotated_two_hundred_twenty_five_degrees",
  /* 1FA32 */ "neutral_chess_knight_rotated_two_hundred_twenty_five_degrees",
  /* 1FA33 */ "white_chess_king_rotated_two_hundred_seventy_degrees",
  /* 1FA34 */ "white_chess_queen_rotated_two_hundred_seventy_degrees",
  /* 1FA35 */ "white_chess_rook_rotated_two_hundred_seventy_degrees",
  /* 1FA36 */ "white_chess_bishop_rotated_two_hundred_seventy_degrees",
  /* 1FA37 */ "white_chess_knight_rotated_two_hundred_seventy_degrees",
  /* 1FA38 */ "white_chess_pawn_rotated_two_hundred_seventy_degrees",
  /* 1FA39 */ "black_chess_king_rotated_two_hundred_seventy_degrees",
  /* 1FA3A */ "black_chess_queen_rotated_two_hundred_seventy_degrees",
  /* 1FA3B */ "black_chess_rook_rotated_two_hundred_seventy_degrees",
  /* 1FA3C */ "black_chess_bishop_rotated_two_hundred_seventy_degrees",
  /* 1FA3D */ "black_chess_knight_rotated_two_hundred_seventy_degrees",
  /* 1FA3E */ "black_chess_pawn_rotated_two_hundred_seventy_degrees",
  /* 1FA3F */ "neutral_chess_king_rotated_two_hundred_seventy_degrees",
  /* 1FA40 */ "neutral_chess_queen_rotated_two_hundred_seventy_degrees",
  /* 1FA41 */ "neutral_chess_rook_rotated_two_hundred_seventy_degrees",
  /* 1FA42 */ "neutral_chess_bishop_rotated_two_hundred_seventy_degrees",
  /* 1FA43 */ "neutral_chess_knight_rotated_two_hundred_seventy_degrees",
  /* 1FA44 */ "neutral_chess_pawn_rotated_two_hundred_seventy_degrees",
  /* 1FA45 */ "white_chess_knight_rotated_three_hundred_fifteen_degrees",
  /* 1FA46 */ "black_chess_knight_rotated_three_hundred_fifteen_degrees",
  /* 1FA47 */ "neutral_chess_knight_rotated_three_hundred_fifteen_degrees",
  /* 1FA48 */ "white_chess_equihopper", "black_chess_equihopper",
  /* 1FA4A */ "neutral_chess_equihopper",
  /* 1FA4B */ "white_chess_equihopper_rotated_ninety_degrees",
  /* 1FA4C */ "black_chess_equihopper_rotated_ninety_degrees",
  /* 1FA4D */ "neutral_chess_equihopper_rotated_ninety_degrees",
  /* 1FA4E */ "white_chess_knight_queen", "white_chess_knight_rook",
  /* 1FA50 */ "white_chess_knight_bishop", "black_chess_knight_queen",
  /* 1FA52 */ "black_chess_knight_rook", "black_chess_knight_bishop", "", "",
  /* 1FA56 */ "", "", "", "", "", "", "", "", "", "", "xiangqi_red_general",
  /* 1FA61 */ "xiangqi_red_mandarin", "xiangqi_red_elephant",
  /* 1FA63 */ "xiangqi_red_horse", "xiangqi_red_chariot", "xiangqi_red_cannon",
  /* 1FA66 */ "xiangqi_red_soldier", "xiangqi_black_general",
  /* 1FA68 */ "xiangqi_black_mandarin", "xiangqi_black_elephant",
  /* 1FA6A */ "xiangqi_black_horse", "xiangqi_black_chariot",
  /* 1FA6C */ "xiangqi_black_cannon", "xiangqi_black_soldier", "", "",
  /* 1FA70 */ "ballet_shoes", "one_piece_swimsuit", "briefs", "shorts",
  /* 1FA74 */ "thong_sandal", "light_blue_heart", "grey_heart", "pink_heart",
  /* 1FA78 */ "drop_of_blood", "adhesive_bandage", "stethoscope", "x_ray",
  /* 1FA7C */ "crutch", "", "", "", "yo_yo", "kite", "parachute", "boomerang",
  /* 1FA84 */ "magic_wand", "pinata", "nesting_dolls", "maracas", "flute",
  /* 1FA89 */ "harp", "", "", "", "", "", "shovel", "ringed_planet", "chair",
  /* 1FA92 */ "razor", "axe", "diya_lamp", "banjo", "military_helmet",
  /* 1FA97 */ "accordion", "long_drum", "coin", "carpentry_saw", "screwdriver",
  /* 1FA9C */ "ladder", "hook", "mirror", "window", "plunger", "sewing_needle",
  /* 1FAA2 */ "knot", "bucket", "mouse_trap", "toothbrush", "headstone",
  /* 1FAA7 */ "placard", "rock", "mirror_ball", "identification_card",
  /* 1FAAB */ "low_battery", "hamsa", "folding_hand_fan", "hair_pick",
  /* 1FAAF */ "khanda", "fly", "worm", "beetle", "cockroach", "potted_plant",
  /* 1FAB5 */ "wood", "feather", "lotus", "coral", "empty_nest",
  /* 1FABA */ "nest_with_eggs", "hyacinth", "jellyfish", "wing",
  /* 1FABE */ "leafless_tree", "goose", "anatomical_heart", "lungs",
  /* 1FAC2 */ "people_hugging", "pregnant_man", "pregnant_person",
  /* 1FAC5 */ "person_with_crown", "fingerprint", "", "", "", "", "", "", "",
  /* 1FACE */ "moose", "donkey", "blueberries", "bell_pepper", "olive",
  /* 1FAD3 */ "flatbread", "tamale", "fondue", "teapot", "pouring_liquid",
  /* 1FAD8 */ "beans", "jar", "ginger_root", "pea_pod", "root_vegetable", "",
  /* 1FADE */ "", "splatter", "melting_face", "saluting_face",
  /* 1FAE2 */ "face_with_open_eyes_and_hand_over_mouth",
  /* 1FAE3 */ "face_with_peeking_eye", "face_with_diagonal_mouth",
  /* 1FAE5 */ "dotted_line_face", "biting_lip", "bubbles", "shaking_face",
  /* 1FAE9 */ "face_with_bags_under_eyes", "", "", "", "", "", "",
  /* 1FAF0 */ "hand_with_index_finger_and_thumb_crossed", "rightwards_hand",
  /* 1FAF2 */ "leftwards_hand", "palm_down_hand", "palm_up_hand",
  /* 1FAF5 */ "index_pointing_at_the_viewer", "heart_hands",
  /* 1FAF7 */ "leftwards_pushing_hand", "rightwards_pushing_hand", "", "", "",
  /* 1FAFC */ "", "", "", "",
};
static_assert(std::size(supplemental) == 0x200);

// Scattered symbols, sorted by code point
struct symbol {
  char32_t c;
  std::string_view s;
};

constexpr symbol symbols[] = {
  { 0x2190, "<-" }, { 0x2191, "^" }, { 0x2192, "->" }, { 0x2193, "v" },
  { 0x2194, "<->" }, { 0x21D0, "<=" }, { 0x21D2, "=>" }, { 0x21D4, "<=>" },
  { 0x2212, "-" }, { 0x2215, "/" }, { 0x2217, "*" }, { 0x221E, "infinity" },
  { 0x2248, "~" }, { 0x2260, "!=" }, { 0x2264, "<=" }, { 0x2265, ">=" },
  { 0x231A, "watch" }, { 0x231B, "hourglass" },
  { 0x23E9, "black_right_pointing_double_triangle" },
  { 0x23EA, "black_left_pointing_double_triangle" },
  { 0x23EB, "black_up_pointing_double_triangle" },
  { 0x23EC, "black_down_pointing_double_triangle" },
  { 0x23ED, "black_right_pointing_double_triangle_with_vertical_bar" },
  { 0x23EE, "black_left_pointing_double_triangle_with_vertical_bar" },
  { 0x23EF, "black_right_pointing_triangle_with_double_vertical_bar" },
  { 0x23F0, "alarm_clock" }, { 0x23F1, "stopwatch" },
  { 0x23F2, "timer_clock" }, { 0x23F3, "hourglass_with_flowing_sand" },
  { 0x23F8, "double_vertical_bar" }, { 0x23F9, "black_square_for_stop" },
  { 0x23FA, "black_circle_for_record" }, { 0x2460, "1" }, { 0x2461, "2" },
  { 0x2462, "3" }, { 0x2463, "4" }, { 0x2464, "5" }, { 0x2465, "6" },
  { 0x2466, "7" }, { 0x2467, "8" }, { 0x2468, "9" }, { 0x2469, "10" },
  { 0x2500, "-" }, { 0x2502, "|" }, { 0x25A0, "#" }, { 0x25CB, "o" },
  { 0x25CF, "*" }, { 0x2B05, "leftwards_black_arrow" },
  { 0x2B06, "upwards_black_arrow" }, { 0x2B07, "downwards_black_arrow" },
  { 0x2B1B, "black_large_square" }, { 0x2B1C, "white_large_square" },
  { 0x2B50, "white_medium_star" }, { 0x2B55, "heavy_large_circle" },
  { 0x3000, " " }, { 0x3001, "," }, { 0x3002, "." }, { 0x300C, "[" },
  { 0x300D, "]" }, { 0x3030, "wavy_dash" },
  { 0x303D, "part_alternation_mark" }, { 0x3297, "congratulations" },
  { 0x3299, "secret" }, { 0x1F004, "mahjong_tile_red_dragon" },
  { 0x1F0CF, "playing_card_black_joker" }, { 0x1F170, "A" }, { 0x1F171, "B" },
  { 0x1F17E, "O" }, { 0x1F17F, "P" }, { 0x1F18E, "AB" }, { 0x1F191, "CL" },
  { 0x1F192, "COOL" }, { 0x1F193, "FREE" }, { 0x1F194, "ID" },
  { 0x1F195, "NEW" }, { 0x1F196, "NG" }, { 0x1F197, "OK" }, { 0x1F198, "SOS" },
  { 0x1F199, "UP!" }, { 0x1F19A, "VS" },
};
static_assert(std::is_sorted(std::begin(symbols), std::end(symbols),
  [](const symbol& a, const symbol& b){ return a.c < b.c; }));

std::string_view find_symbol(char32_t c) noexcept {
  const auto it = std::lower_bound(
    std::begin(symbols), std::end(symbols), c,
    [](const symbol& a, char32_t c){ return a.c < c; });
  if (it == std::end(symbols) || it->c != c) return { };
  return it->s;
}

}

std::string_view translit(char32_t c) noexcept {
  if (c < 0x80) return { ascii + c, 1 };
  if (c < 0x250) return latin[c - 0x80];
  if (c < 0x370) return { };
  if (c < 0x400) return greek[c - 0x370];
  if (c < 0x460) return cyrillic[c - 0x400];
  if (c < 0x1E00) return { };
  if (c < 0x1F00) return latin_additional[c - 0x1E00];
  if (c < 0x2000) return { };
  if (c < 0x20D0) return punctuation[c - 0x2000];
  if (c < 0x2100) return { };
  if (c < 0x2190) return letterlike[c - 0x2100];
  if (0x2600 <= c && c < 0x27C0) return misc_symbols[c - 0x2600];
  if (0xFB00 <= c && c < 0xFB07) return ligatures[c - 0xFB00];
  // fullwidth forms of ! through ~
  if (0xFF01 <= c && c < 0xFF5F) return { ascii + (c - 0xFEE0), 1 };
  // regional indicators, pairs of which spell flags
  if (0x1F1E6 <= c && c < 0x1F200) return { ascii + (U'A' + c - 0x1F1E6), 1 };
  if (0x1F300 <= c && c < 0x1F650) return pictographs[c - 0x1F300];
  if (0x1F680 <= c && c < 0x1F700) return transport[c - 0x1F680];
  if (0x1F900 <= c && c < 0x1FB00) return supplemental[c - 0x1F900];
  return find_symbol(c);
}

} // end namespace lexcmp
