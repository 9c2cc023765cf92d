#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <vector>
#include <random>
#include <fstream>
#include <iostream>

// One column per inferred type plus coded ids (AB-1234) and a mostly empty column.
int main(int argc, char** argv){
  if (argc < 4){
    std::cerr << "usage: gen_synth_csv <out.csv> <rows> <quoted:0|1> [null_every:N]\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const bool quoted = std::string(argv[3]) == "1";
  const std::uint64_t null_every = argc > 4 ? std::strtoull(argv[4], nullptr, 10) : 0;

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  // header
  f << "id,int_col,float_col,bool_col,date_col,str_col,code_col,amount_text,sparse_col\n";

  std::mt19937_64 rng(42);
  std::uniform_int_distribution<long long> di(-100000, 100000);
  std::uniform_real_distribution<double> df(-1e4, 1e4);
  std::uniform_int_distribution<int> dl(0, 25);
  std::uniform_int_distribution<int> dd(0, 9);
  const char* words[] = {"alpha","bravo","charlie","delta","echo","foxtrot"};
  for (std::uint64_t i=1;i<=rows;++i){
    const bool make_null = null_every > 0 && (i % null_every) == 0;
    long long iv = di(rng);
    double fv = df(rng);
    bool bv = (i % 3) == 0;
    int y = 2023 + int(i % 3), m = 1 + int(i % 12), d = 1 + int(i % 28);
    char datebuf[32];
    std::snprintf(datebuf, sizeof(datebuf), "%04d-%02d-%02d", y, m, d);
    std::string s = words[i % 6];

    // e.g. AB-1234
    std::string code;
    code.push_back(char('A' + dl(rng)));
    code.push_back(char('A' + dl(rng)));
    code.push_back('-');
    for (int k = 0; k < 4; ++k) code.push_back(char('0' + dd(rng)));

    char amount[32];
    std::snprintf(amount, sizeof(amount), "%.2f", fv);

    auto emit = [&](const std::string& x){
      if (!quoted) { f << x; return; }
      f << '"';
      for (char c: x){ if (c=='"') f << "\"\""; else f << c; }
      f << '"';
    };

    emit(std::to_string(i)); f << ",";
    emit(make_null ? "" : std::to_string(iv)); f << ",";
    emit(std::to_string(fv)); f << ",";
    emit(bv ? "true" : "false"); f << ",";
    emit(make_null ? "NA" : datebuf); f << ",";
    // Add some commas/quotes/newlines occasionally when quoted mode is on
    if (quoted && (i % 17 == 0)) s += ", said \"hi\"";
    if (i % 23 == 0) s = "   ";
    emit(s); f << ",";
    emit(code); f << ",";
    emit(amount); f << ",";
    emit((i % 4) == 0 ? std::string(words[i % 6]) : std::string());
    f << "\n";
  }
  std::cerr << "wrote " << rows << " rows to " << out << "\n";
  return 0;
}
