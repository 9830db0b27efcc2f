#include "notify/message_formatter.h"

#include <cstdio>
#include <sstream>
#include <vector>

#include "core/text_utils.h"

namespace pm_sentinel {

namespace {

/// 单语言模板集合；占位内容由调用方拼接，模板仅提供固定文案。
struct MessageTemplates {
  const char* gap_header;
  const char* gap_label;
  const char* higher_suffix;  ///< "%s" 为平台名。
  const char* similarity_label;
  const char* move_header;
  const char* move_over;      ///< 后接分钟数。
  const char* minutes_unit;
  const char* news_header;
  const char* keywords_label;
  const char* category_label;
  const char* read_more;
  const char* heartbeat_header;
  const char* runs_label;
  const char* markets_label;
  const char* pairs_label;
  const char* alerts_label;
  const char* errors_label;
  const char* corr_header;
  const char* mover_label;
  const char* laggard_label;
  const char* hint_label;
  const char* startup_header;
  const char* interval_label;
  const char* threshold_label;
  const char* corr_threshold_label;
  const char* feeds_label;
  const char* history_label;
  const char* history_restored;
  const char* history_empty;
  const char* languages_label;
};

const MessageTemplates kEnglish{
    "⚖️ <b>Cross-platform gap</b>",
    "Gap",
    "%s higher",
    "Match similarity",
    "📈 <b>Big price move</b>",
    "over",
    "min",
    "📰 <b>Market-relevant news</b>",
    "Keywords",
    "Category",
    "Read more",
    "💓 <b>pm-sentinel heartbeat</b>",
    "Runs",
    "Markets tracked",
    "Matched pairs",
    "Alerts this run",
    "Errors this run",
    "🔗 <b>Correlation anomaly</b>",
    "Moved",
    "Did not react",
    "Related by",
    "🚀 <b>pm-sentinel started</b>",
    "Scan interval",
    "Gap/move threshold",
    "Correlation threshold",
    "News feeds",
    "History",
    "restored",
    "empty (fills on first scan)",
    "Languages",
};

const MessageTemplates kHebrew{
    "⚖️ <b>פער בין פלטפורמות</b>",
    "פער",
    "%s גבוה יותר",
    "דמיון התאמה",
    "📈 <b>תנועת מחיר חדה</b>",
    "במשך",
    "דק׳",
    "📰 <b>חדשות רלוונטיות לשווקים</b>",
    "מילות מפתח",
    "קטגוריה",
    "לכתבה המלאה",
    "💓 <b>pm-sentinel פעיל</b>",
    "סריקות",
    "שווקים במעקב",
    "זוגות מותאמים",
    "התראות בסריקה זו",
    "שגיאות בסריקה זו",
    "🔗 <b>קורלציה חריגה</b>",
    "שוק שזז",
    "שוק שלא הגיב",
    "קשר לפי",
    "🚀 <b>pm-sentinel הופעל</b>",
    "מרווח סריקה",
    "סף פער/תנועה",
    "סף קורלציה",
    "מקורות חדשות",
    "זיכרון",
    "שוחזר",
    "ריק (יתמלא בסריקה הראשונה)",
    "שפות",
};

const MessageTemplates kFrench{
    "⚖️ <b>Écart entre plateformes</b>",
    "Écart",
    "%s plus haut",
    "Similarité",
    "📈 <b>Forte variation de prix</b>",
    "en",
    "min",
    "📰 <b>Actualité pertinente pour les marchés</b>",
    "Mots-clés",
    "Catégorie",
    "Lire la suite",
    "💓 <b>pm-sentinel actif</b>",
    "Cycles",
    "Marchés suivis",
    "Paires appariées",
    "Alertes ce cycle",
    "Erreurs ce cycle",
    "🔗 <b>Anomalie de corrélation</b>",
    "A bougé",
    "N'a pas réagi",
    "Lien",
    "🚀 <b>pm-sentinel démarré</b>",
    "Intervalle de scan",
    "Seuil écart/variation",
    "Seuil de corrélation",
    "Flux d'actualité",
    "Historique",
    "restauré",
    "vide (rempli au premier scan)",
    "Langues",
};

const MessageTemplates& TemplatesFor(const std::string& language) {
  const std::string lowered = ToLowerCopy(Trim(language));
  if (lowered == "he") {
    return kHebrew;
  }
  if (lowered == "fr") {
    return kFrench;
  }
  return kEnglish;
}

std::string FormatFixed(double value, int decimals) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
  return buffer;
}

std::string ReplacePlatform(const char* pattern, const char* platform) {
  std::string out(pattern);
  const std::size_t pos = out.find("%s");
  if (pos != std::string::npos) {
    out.replace(pos, 2, platform);
  }
  return out;
}

/// `Polymarket: 45.2% → 62.8% (+17.6 pts)`
std::string PriceChangeLine(const Market& market, double before) {
  const double points = (market.price - before) * 100.0;
  return std::string(DisplayName(market.platform)) + ": " + FormatPercent(before) + " → " +
         FormatPercent(market.price) + " (" + (points >= 0.0 ? "+" : "") +
         FormatFixed(points, 1) + " pts)";
}

std::string Link(const std::string& url, const std::string& label) {
  return "<a href=\"" + HtmlEscape(url) + "\">" + HtmlEscape(label) + "</a>";
}

}  // namespace

std::string HtmlEscape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    switch (ch) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
  return out;
}

std::string FormatPercent(double probability) {
  return FormatFixed(probability * 100.0, 1) + "%";
}

std::string FormatSignal(const GapSignal& signal, const std::string& language) {
  const MessageTemplates& t = TemplatesFor(language);
  const Market& poly = *signal.pair.poly;
  const Market& kalshi = *signal.pair.kalshi;
  const char* higher = signal.direction == GapDirection::kPolyHigher
                           ? DisplayName(Platform::kPolymarket)
                           : DisplayName(Platform::kKalshi);

  std::ostringstream oss;
  oss << t.gap_header << ": " << FormatFixed(signal.gap_bps / 100.0, 1) << "%\n\n"
      << "<b>" << HtmlEscape(poly.title) << "</b>\n";
  if (kalshi.title != poly.title) {
    oss << "<i>" << HtmlEscape(kalshi.title) << "</i>\n";
  }
  oss << "\n"
      << DisplayName(Platform::kPolymarket) << ": " << FormatPercent(poly.price)
      << " | " << DisplayName(Platform::kKalshi) << ": " << FormatPercent(kalshi.price)
      << "\n"
      << t.gap_label << ": " << signal.gap_bps << " bps ("
      << ReplacePlatform(t.higher_suffix, higher) << ")\n"
      << t.similarity_label << ": " << FormatFixed(signal.pair.similarity, 2) << "\n\n"
      << Link(poly.url, DisplayName(Platform::kPolymarket)) << " | "
      << Link(kalshi.url, DisplayName(Platform::kKalshi));
  return oss.str();
}

std::string FormatSignal(const MoveSignal& signal, const std::string& language) {
  const MessageTemplates& t = TemplatesFor(language);
  const Market& market = *signal.market;
  const bool up = signal.after_price >= signal.before_price;
  const double points = (signal.after_price - signal.before_price) * 100.0;

  std::ostringstream oss;
  oss << t.move_header << " " << (up ? "▲" : "▼") << "\n\n"
      << "<b>" << HtmlEscape(market.title) << "</b>\n\n"
      << DisplayName(market.platform) << ": " << FormatPercent(signal.before_price)
      << " → " << FormatPercent(signal.after_price) << " ("
      << (up ? "+" : "") << FormatFixed(points, 1) << " pts, " << signal.move_bps
      << " bps)\n"
      << t.move_over << " " << signal.elapsed_minutes << " " << t.minutes_unit << "\n\n"
      << Link(market.url, DisplayName(market.platform));
  return oss.str();
}

std::string FormatSignal(const NewsSignal& signal, const std::string& language) {
  const MessageTemplates& t = TemplatesFor(language);
  std::string keywords;
  for (const auto& keyword : signal.matched_keywords) {
    if (!keywords.empty()) {
      keywords += ", ";
    }
    keywords += HtmlEscape(keyword);
  }

  std::ostringstream oss;
  oss << t.news_header << "\n\n"
      << "<b>" << HtmlEscape(signal.item.title) << "</b>\n";
  if (!signal.item.source.empty()) {
    oss << "<i>" << HtmlEscape(signal.item.source) << "</i>\n";
  }
  oss << "\n";
  if (!signal.category.empty()) {
    oss << t.category_label << ": " << HtmlEscape(signal.category) << "\n";
  }
  oss << t.keywords_label << ": " << keywords;
  if (!signal.item.link.empty()) {
    oss << "\n\n" << Link(signal.item.link, t.read_more);
  }
  return oss.str();
}

std::string FormatSignal(const CorrelationSignal& signal, const std::string& language) {
  const MessageTemplates& t = TemplatesFor(language);
  const Market& mover = *signal.mover;
  const Market& laggard = *signal.laggard;

  std::ostringstream oss;
  oss << t.corr_header << "\n\n"
      << t.mover_label << ": <b>" << HtmlEscape(mover.title) << "</b>\n"
      << PriceChangeLine(mover, signal.mover_before) << "\n\n"
      << t.laggard_label << ": <b>" << HtmlEscape(laggard.title) << "</b>\n"
      << PriceChangeLine(laggard, signal.laggard_before) << "\n\n";
  if (!signal.hint.empty()) {
    const std::size_t bar = signal.hint.find('|');
    oss << t.hint_label << ": "
        << HtmlEscape(bar == std::string::npos
                          ? signal.hint
                          : signal.hint.substr(0, bar) + " / " + signal.hint.substr(bar + 1))
        << "\n";
  } else {
    oss << t.similarity_label << ": " << FormatFixed(signal.similarity, 2) << "\n";
  }
  oss << "\n"
      << Link(mover.url, DisplayName(mover.platform)) << " | "
      << Link(laggard.url, DisplayName(laggard.platform));
  return oss.str();
}

std::string FormatStartup(const StartupInfo& info, const std::string& language) {
  const MessageTemplates& t = TemplatesFor(language);
  std::string languages;
  for (const auto& item : info.languages) {
    if (!languages.empty()) {
      languages += ", ";
    }
    languages += HtmlEscape(item);
  }

  std::ostringstream oss;
  oss << t.startup_header << "\n\n"
      << t.interval_label << ": " << info.interval_minutes << " " << t.minutes_unit << "\n"
      << t.threshold_label << ": " << info.threshold_bps << " bps\n";
  if (info.correlation_threshold_bps > 0) {
    oss << t.corr_threshold_label << ": " << info.correlation_threshold_bps << " bps\n";
  }
  oss << t.feeds_label << ": " << info.feeds << "\n"
      << t.history_label << ": ";
  if (info.run_count > 0) {
    oss << t.history_restored << " (" << t.runs_label << ": " << info.run_count << ")";
  } else {
    oss << t.history_empty;
  }
  oss << "\n" << t.languages_label << ": " << languages;
  return oss.str();
}

std::string FormatHeartbeat(const HeartbeatStats& stats, const std::string& language) {
  const MessageTemplates& t = TemplatesFor(language);
  std::ostringstream oss;
  oss << t.heartbeat_header << "\n\n"
      << t.runs_label << ": " << stats.run_count << "\n"
      << t.markets_label << ": " << stats.markets_tracked << "\n"
      << t.pairs_label << ": " << stats.pairs_matched << "\n"
      << t.alerts_label << ": " << stats.signals_fired;
  if (stats.errors > 0) {
    oss << "\n" << t.errors_label << ": " << stats.errors;
  }
  return oss.str();
}

}  // namespace pm_sentinel
