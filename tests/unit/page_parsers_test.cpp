#include "internal/probe/page_parsers.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace mirrorwatch::probe;

std::string ProfilePage(const std::string& name, int posts) {
  std::string page = R"(<html><body><div class="profile-card"><a class="profile-card-username" href="/jack">
    @)" + name + R"(
  </a></div><div class="timeline">)";
  for (int i = 0; i < posts; ++i) {
    page += R"(<div class="timeline-item "><div class="tweet-body">post</div></div>)";
  }
  page += R"(<div class="show-more"><a href="?cursor=1">Load more</a></div></div></body></html>)";
  return page;
}

void TestProfileParsed() {
  auto parsed = ParseProfile(ProfilePage("jack", 7));
  auto* profile = std::get_if<ProfileParsed>(&parsed);
  assert(profile);
  assert(profile->name == "@jack");
  assert(profile->post_count == 7);
}

void TestProfileWithoutCardOrTimeline() {
  auto no_card = ParseProfile(R"(<div class="timeline"><div class="timeline-item"></div></div>)");
  assert(std::get<ParseFailure>(no_card).message == "no profile card found");

  auto no_timeline = ParseProfile(R"(<a class="profile-card-username">@jack</a><div class="error-panel">User not found</div>)");
  assert(std::get<ParseFailure>(no_timeline).message == "no timeline found");
}

void TestEmptyTimelineCountsZero() {
  auto parsed = ParseProfile(ProfilePage("jack", 0));
  assert(std::get<ProfileParsed>(parsed).post_count == 0);
}

void TestAboutWithCommit() {
  auto parsed = ParseAbout(R"(<div class="overlay-panel">
    <h1>About</h1>
    <p>Nitter is a free and open source alternative Twitter front-end.</p>
    <p>Version <a href="https://github.com/zedeus/nitter/commit/a1b2c3d4e5f">2024.01.02-a1b2c3d</a></p>
  </div>)");
  auto* about = std::get_if<AboutParsed>(&parsed);
  assert(about);
  assert(about->version == "2024.01.02-a1b2c3d");
  assert(about->url == "https://github.com/zedeus/nitter/commit/a1b2c3d4e5f");
  assert(about->commit == "a1b2c3d4e5f");
}

void TestAboutWithRelease() {
  auto parsed = ParseAbout(R"(<p>Version <a href="https://example.org/fork/releases/1.2.3/">1.2.3</a></p>)");
  auto* about = std::get_if<AboutParsed>(&parsed);
  assert(about);
  assert(about->version == "1.2.3");
  assert(about->commit == "1.2.3");
}

void TestAboutFailures() {
  assert(std::get<ParseFailure>(ParseAbout("<p>nothing here</p>")).message == "no version paragraph found");
  assert(std::get<ParseFailure>(ParseAbout("<p>Version unknown</p>")).message == "version paragraph without link");
  assert(std::get<ParseFailure>(ParseAbout("<p>Version <a>abc</a></p>")).message == "version link without href");

  auto bad_format = ParseAbout(R"(<p>Version <a href="/x">dev</a></p>)");
  assert(std::get<ParseFailure>(bad_format).message == "unexpected version format 'dev'");
}

} // namespace

int main() {
  TestProfileParsed();
  TestProfileWithoutCardOrTimeline();
  TestEmptyTimelineCountsZero();
  TestAboutWithCommit();
  TestAboutWithRelease();
  TestAboutFailures();

  std::cout << "page_parsers_test: pass\n";
  return 0;
}
